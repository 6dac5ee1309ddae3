#ifndef DLQUEUE_QUEUE_TYPES_HPP_
#define DLQUEUE_QUEUE_TYPES_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Downloader/TaskTypes.hpp"

namespace dlqueue {

using EntryId = std::string;

// Live state reported for an active entry whose handle the pool no longer
// recognizes.
inline constexpr const char* kUnknownAtDownloader = "unknown_at_downloader";
inline constexpr const char* kNotFound = "not_found";

// Copy of a backlog entry as the queue manager sees it.
struct BacklogSnapshot {
  EntryId id;
  std::string source;
  std::string destination;
  int priority = 0;
  std::chrono::system_clock::time_point submittedAt;
  // "queued", "active", or the last pool state copied in by reconciliation.
  std::string state;
};

struct ActiveEntryView {
  BacklogSnapshot entry;
  std::optional<TaskHandle> handle;  // empty while being handed to the pool
  std::optional<TaskSnapshot> live;  // empty when there is nothing to report
  // Label of live->state, kUnknownAtDownloader when the pool dropped the
  // handle, empty when no handle has been issued yet.
  std::string liveState;
};

struct RetiredCounts {
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t cancelled = 0;
  uint64_t lost = 0;  // handle vanished from the pool

  uint64_t total() const { return completed + failed + cancelled + lost; }
};

struct QueueStatus {
  std::vector<BacklogSnapshot> queued;
  std::vector<ActiveEntryView> active;
  size_t queuedCount = 0;
  size_t activeCount = 0;
  RetiredCounts retired;
};

struct EntryDetail {
  EntryId id;
  bool found = false;
  std::string state;  // queue manager's label, or kNotFound
  std::optional<TaskHandle> handle;
  std::string poolState;  // pool's label, "unknown" if it has no record
  std::string error;
  std::string details;
};

// Combines the queue's record of an entry with what the pool reports for it.
ActiveEntryView mergeEntryStatus(const BacklogSnapshot& entry,
                                 const std::optional<TaskHandle>& handle,
                                 const std::optional<TaskSnapshot>& live);

}  // namespace dlqueue

#endif  // DLQUEUE_QUEUE_TYPES_HPP_
