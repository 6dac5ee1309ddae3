#ifndef DLQUEUE_QUEUE_MANAGER_HPP_
#define DLQUEUE_QUEUE_MANAGER_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Downloader/TransferPool.hpp"
#include "QueueTypes.hpp"

namespace dlqueue {

namespace utils {
class Timer;
}  // namespace utils

// Priority backlog in front of a TransferPool. Requests wait in the backlog
// until the reconciliation loop promotes them, keeping at most
// pool.capacity() entries active. Lower priority values go first; equal
// priorities go in arrival order.
//
// Backlog and active set share one mutex, which is never held while calling
// into the pool.
class QueueManager {
 public:
  QueueManager(TransferPool& pool,
               std::chrono::milliseconds interval = std::chrono::seconds(1),
               std::chrono::milliseconds stopTimeout = std::chrono::seconds(5));
  ~QueueManager();

  QueueManager(const QueueManager&) = delete;
  QueueManager& operator=(const QueueManager&) = delete;

  EntryId add(const std::string& source, const std::string& destination,
              int priority = 0);

  // Queued entries are dropped at once. Active entries get their transfer
  // cancelled and leave the active set once the loop sees the terminal state.
  // Returns false if the id is unknown.
  bool remove(const EntryId& id);

  QueueStatus status() const;
  EntryDetail statusOf(const EntryId& id) const;

  // Does nothing if the loop is running, or if the loop left behind by a
  // timed-out stop() is still inside a pass.
  void start();
  // Returns false if the loop did not exit within the stop timeout.
  bool stop();
  bool isRunning() const;

  // One reconciliation pass: sync live states, retire finished entries,
  // promote from the backlog. The loop calls this on every tick.
  void reconcileOnce();

 private:
  enum class QueueState { Queued, Active };

  struct BacklogEntry {
    EntryId id;
    std::string source;
    std::string destination;
    int priority = 0;
    std::chrono::system_clock::time_point submittedAt;
    uint64_t sequence = 0;
    QueueState state = QueueState::Queued;
    std::optional<TaskState> mirrored;
  };

  struct ActiveEntry {
    BacklogEntry entry;
    std::optional<TaskHandle> handle;
    bool withdrawRequested = false;
  };

  static BacklogSnapshot snapshotOf(const BacklogEntry& entry);
  static std::string stateLabel(const BacklogEntry& entry);
  void insertSorted(BacklogEntry entry);

  TransferPool& pool_;
  const std::chrono::milliseconds interval_;
  const std::chrono::milliseconds stopTimeout_;

  mutable std::mutex mutex_;
  uint64_t nextEntryId_;
  std::vector<BacklogEntry> backlog_;  // sorted by (priority, sequence)
  std::vector<ActiveEntry> active_;    // in dispatch order
  RetiredCounts retired_;

  std::mutex cycleMutex_;  // one reconciliation pass at a time

  mutable std::mutex timerMutex_;
  std::unique_ptr<utils::Timer> timer_;
};

}  // namespace dlqueue

#endif  // DLQUEUE_QUEUE_MANAGER_HPP_
