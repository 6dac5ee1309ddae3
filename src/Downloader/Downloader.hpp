#ifndef DLQUEUE_DOWNLOADER_HPP_
#define DLQUEUE_DOWNLOADER_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "Fetcher.hpp"
#include "TaskTypes.hpp"
#include "TransferPool.hpp"

namespace dlqueue {

class StorageManager;

// Runs every submitted transfer on its own thread. The pool does not limit
// concurrency; `workers` is only reported through capacity() for the owner
// to respect.
//
// All task fields live in one table guarded by one mutex. Worker threads
// take it briefly at each checkpoint and never hold it across network or
// disk I/O.
class Downloader : public TransferPool {
 public:
  Downloader(size_t workers, std::shared_ptr<Fetcher> fetcher,
             std::shared_ptr<StorageManager> storage);
  ~Downloader() override;

  Downloader(const Downloader&) = delete;
  Downloader& operator=(const Downloader&) = delete;

  std::optional<TaskHandle> submit(const std::string& source,
                                   const std::string& destination) override;
  std::optional<TaskSnapshot> status(const TaskHandle& handle) const override;
  bool cancel(const TaskHandle& handle) override;
  bool retire(const TaskHandle& handle) override;
  size_t capacity() const override { return workers_; }

  // Status-only: the transfer thread keeps running while Paused.
  bool pause(const TaskHandle& handle);
  // Paused -> Pending. Does not restart anything by itself.
  bool resume(const TaskHandle& handle);

  std::vector<TaskSnapshot> listTasks() const;

 private:
  struct DownloadTask {
    TaskHandle handle;
    std::string source;
    std::string destination;
    TaskState state = TaskState::Pending;
    uint64_t bytesTransferred = 0;
    uint64_t totalBytes = 0;
    double progressPercent = 0.0;
    std::string error;
    bool workerExited = false;
  };

  enum class Checkpoint { Continue, Cancelled, Gone };

  TaskHandle nextHandle();
  static TaskSnapshot snapshotOf(const DownloadTask& task);

  void handleDownload(const TaskHandle& handle, const std::string& source,
                      const std::string& destination);
  void transfer(const TaskHandle& handle, const std::string& source,
                const std::string& destination, bool& fileCreated);

  Checkpoint checkpoint(const TaskHandle& handle);
  Checkpoint publishTotal(const TaskHandle& handle, uint64_t totalBytes);
  Checkpoint reportProgress(const TaskHandle& handle, uint64_t transferred);
  void finishCancelled(const TaskHandle& handle, const std::string& destination,
                       bool cleanup);
  void finishFailed(const TaskHandle& handle, const std::string& destination,
                    const std::string& error, bool cleanup);
  void finishCompleted(const TaskHandle& handle, const std::string& destination);
  void markWorkerExited(const TaskHandle& handle,
                        const std::string& destination);

  const size_t workers_;
  std::shared_ptr<Fetcher> fetcher_;
  std::shared_ptr<StorageManager> storage_;

  mutable std::mutex mutex_;
  uint64_t nextTaskId_;
  std::unordered_map<TaskHandle, DownloadTask> tasks_;
  std::unordered_map<TaskHandle, std::thread> threads_;
};

}  // namespace dlqueue

#endif  // DLQUEUE_DOWNLOADER_HPP_
