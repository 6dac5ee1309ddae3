#include "Downloader.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "Storage/StorageManager.hpp"
#include "TransferErrors.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace dlqueue {

Downloader::Downloader(size_t workers, std::shared_ptr<Fetcher> fetcher,
                       std::shared_ptr<StorageManager> storage)
    : workers_(workers),
      fetcher_(std::move(fetcher)),
      storage_(std::move(storage)),
      nextTaskId_(0) {}

Downloader::~Downloader() {
  std::unordered_map<TaskHandle, std::thread> threads;
  std::vector<std::pair<TaskHandle, std::string>> orphaned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : tasks_) {
      DownloadTask& task = kv.second;
      if (isTerminal(task.state) || task.state == TaskState::Cancelling) {
        continue;
      }
      task.state = TaskState::Cancelling;
      if (task.workerExited) {
        orphaned.emplace_back(task.handle, task.destination);
      }
    }
    threads.swap(threads_);
  }
  for (const auto& o : orphaned) {
    finishCancelled(o.first, o.second, true);
  }
  if (!threads.empty()) {
    LOG(INFO) << "Waiting for " << threads.size() << " worker thread(s) to exit.";
  }
  for (auto& kv : threads) {
    if (kv.second.joinable()) {
      kv.second.join();
    }
  }
}

TaskHandle Downloader::nextHandle() {
  return "dl_" + std::to_string(++nextTaskId_);
}

TaskSnapshot Downloader::snapshotOf(const DownloadTask& task) {
  TaskSnapshot snapshot;
  snapshot.handle = task.handle;
  snapshot.source = task.source;
  snapshot.destination = task.destination;
  snapshot.state = task.state;
  snapshot.bytesTransferred = task.bytesTransferred;
  snapshot.totalBytes = task.totalBytes;
  snapshot.progressPercent = task.progressPercent;
  snapshot.error = task.error;
  return snapshot;
}

std::optional<TaskHandle> Downloader::submit(const std::string& source,
                                             const std::string& destination) {
  TaskHandle handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle = nextHandle();
    DownloadTask task;
    task.handle = handle;
    task.source = source;
    task.destination = destination;
    tasks_.emplace(handle, std::move(task));
  }

  std::thread worker;
  try {
    worker = std::thread(&Downloader::handleDownload, this, handle, source,
                         destination);
  } catch (const std::system_error& e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = tasks_.find(handle);
      if (it != tasks_.end()) {
        it->second.state = TaskState::Failed;
        it->second.error =
            std::string("Could not start worker thread: ") + e.what();
        it->second.workerExited = true;
      }
    }
    LOG(ERROR) << "Download " << handle << " could not start: " << e.what();
    return handle;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    threads_.emplace(handle, std::move(worker));
    auto it = tasks_.find(handle);
    if (it != tasks_.end() && it->second.state == TaskState::Pending) {
      it->second.state = TaskState::Downloading;
    }
  }
  LOG(INFO) << "Download " << handle << " started for " << source << " to "
            << destination;
  return handle;
}

std::optional<TaskSnapshot> Downloader::status(const TaskHandle& handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(handle);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return snapshotOf(it->second);
}

std::vector<TaskSnapshot> Downloader::listTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TaskSnapshot> out;
  out.reserve(tasks_.size());
  for (const auto& kv : tasks_) {
    out.push_back(snapshotOf(kv.second));
  }
  return out;
}

bool Downloader::cancel(const TaskHandle& handle) {
  std::optional<TaskState> before;
  std::optional<std::string> orphanedDestination;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it != tasks_.end()) {
      DownloadTask& task = it->second;
      before = task.state;
      if (isTerminal(task.state)) {
        // Nothing will run any more; record that as Cancelled.
        task.state = TaskState::Cancelled;
        task.error.clear();
      } else if (task.state != TaskState::Cancelling) {
        task.state = TaskState::Cancelling;
        if (task.workerExited) {
          // No checkpoint is left to observe Cancelling once the worker is
          // gone, so finalize here.
          orphanedDestination = task.destination;
        }
      }
    }
  }

  if (!before) {
    LOG(WARN) << "Download " << handle << " not found. Cannot cancel.";
    return false;
  }
  if (*before == TaskState::Cancelling) {
    LOG(INFO) << "Download " << handle << " is already being cancelled.";
  } else if (isTerminal(*before)) {
    LOG(INFO) << "Download " << handle << " already "
              << taskStateName(*before) << ", marked cancelled.";
  } else if (orphanedDestination) {
    LOG(INFO) << "Download " << handle << " (" << taskStateName(*before)
              << ") has no worker left, cancelling now.";
    finishCancelled(handle, *orphanedDestination, true);
  } else {
    LOG(INFO) << "Download " << handle << " (" << taskStateName(*before)
              << ") marked cancelling.";
  }
  return true;
}

bool Downloader::pause(const TaskHandle& handle) {
  std::optional<TaskState> current;
  bool paused = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it != tasks_.end()) {
      current = it->second.state;
      if (it->second.state == TaskState::Pending ||
          it->second.state == TaskState::Downloading) {
        it->second.state = TaskState::Paused;
        paused = true;
      }
    }
  }
  if (!current) {
    LOG(WARN) << "Download " << handle << " not found. Cannot pause.";
  } else if (!paused) {
    LOG(WARN) << "Download " << handle << " is " << taskStateName(*current)
              << ". Cannot pause.";
  } else {
    LOG(INFO) << "Download " << handle << " marked as paused.";
  }
  return paused;
}

bool Downloader::resume(const TaskHandle& handle) {
  std::optional<TaskState> current;
  bool resumed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it != tasks_.end()) {
      current = it->second.state;
      if (it->second.state == TaskState::Paused) {
        it->second.state = TaskState::Pending;
        resumed = true;
      }
    }
  }
  if (!current) {
    LOG(WARN) << "Download " << handle << " not found. Cannot resume.";
  } else if (!resumed) {
    LOG(WARN) << "Download " << handle << " is " << taskStateName(*current)
              << ". Cannot resume.";
  } else {
    LOG(INFO) << "Download " << handle << " marked as pending.";
  }
  return resumed;
}

bool Downloader::retire(const TaskHandle& handle) {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it == tasks_.end() || !isTerminal(it->second.state)) {
      return false;
    }
    tasks_.erase(it);
    auto th = threads_.find(handle);
    if (th != threads_.end()) {
      worker = std::move(th->second);
      threads_.erase(th);
    }
  }
  // The worker has already written its terminal state; joining only waits
  // for it to return.
  if (worker.joinable()) {
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  LOG(DEBUG) << "Download " << handle << " retired.";
  return true;
}

void Downloader::handleDownload(const TaskHandle& handle,
                                const std::string& source,
                                const std::string& destination) {
  bool cancelledEarly = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it == tasks_.end()) {
      cancelledEarly = true;
    } else if (it->second.state == TaskState::Pending) {
      it->second.state = TaskState::Downloading;
    } else if (it->second.state == TaskState::Cancelling) {
      it->second.state = TaskState::Cancelled;
      it->second.workerExited = true;
      cancelledEarly = true;
    }
  }
  if (cancelledEarly) {
    LOG(INFO) << "Download " << handle << " stopped before any I/O.";
    return;
  }

  bool fileCreated = false;
  try {
    transfer(handle, source, destination, fileCreated);
  } catch (const DestinationPrepareError& e) {
    LOG(ERROR) << "Download " << handle << " I/O error: " << e.what();
    finishFailed(handle, destination,
                 std::string("File/Directory error: ") + e.what(), false);
  } catch (const TransportError& e) {
    LOG(ERROR) << "Download " << handle << " failed: " << e.what();
    finishFailed(handle, destination, e.what(), fileCreated);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Download " << handle << " unexpected error: " << e.what();
    finishFailed(handle, destination,
                 std::string("Unexpected error during download: ") + e.what(),
                 fileCreated);
  }
  markWorkerExited(handle, destination);
}

void Downloader::transfer(const TaskHandle& handle, const std::string& source,
                          const std::string& destination, bool& fileCreated) {
  const fs::path target(destination);
  if (target.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw DestinationPrepareError("cannot create directory '" +
                                    target.parent_path().string() +
                                    "': " + ec.message());
    }
  }
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw DestinationPrepareError("cannot open '" + destination +
                                  "' for writing");
  }
  fileCreated = true;

  std::unique_ptr<FetchResponse> response = fetcher_->open(source);
  if (!response) {
    throw TransportError("no response for " + source);
  }

  Checkpoint cp = publishTotal(handle, response->totalBytes());
  uint64_t transferred = 0;
  std::string chunk;
  while (cp == Checkpoint::Continue) {
    const bool more = response->nextChunk(chunk);
    cp = checkpoint(handle);
    if (cp != Checkpoint::Continue || !more) {
      break;
    }
    if (chunk.empty()) {
      continue;
    }
    out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!out) {
      throw UnexpectedError("write to '" + destination + "' failed");
    }
    transferred += chunk.size();
    cp = reportProgress(handle, transferred);
  }

  if (cp == Checkpoint::Gone) {
    LOG(WARN) << "Download " << handle
              << " task removed externally during download. Stopping.";
    return;
  }
  out.close();
  if (cp == Checkpoint::Cancelled) {
    finishCancelled(handle, destination, true);
    return;
  }
  if (!out) {
    throw UnexpectedError("closing '" + destination + "' failed");
  }
  finishCompleted(handle, destination);
}

Downloader::Checkpoint Downloader::checkpoint(const TaskHandle& handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(handle);
  if (it == tasks_.end()) {
    return Checkpoint::Gone;
  }
  return it->second.state == TaskState::Cancelling ? Checkpoint::Cancelled
                                                   : Checkpoint::Continue;
}

Downloader::Checkpoint Downloader::publishTotal(const TaskHandle& handle,
                                                uint64_t totalBytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(handle);
  if (it == tasks_.end()) {
    return Checkpoint::Gone;
  }
  if (it->second.state == TaskState::Cancelling) {
    return Checkpoint::Cancelled;
  }
  it->second.totalBytes = totalBytes;
  return Checkpoint::Continue;
}

Downloader::Checkpoint Downloader::reportProgress(const TaskHandle& handle,
                                                  uint64_t transferred) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(handle);
  if (it == tasks_.end()) {
    return Checkpoint::Gone;
  }
  DownloadTask& task = it->second;
  if (task.state == TaskState::Cancelling) {
    return Checkpoint::Cancelled;
  }
  task.bytesTransferred = transferred;
  if (task.totalBytes > 0) {
    // 服务端少报了大小，以实际收到的为准
    if (task.bytesTransferred > task.totalBytes) {
      task.totalBytes = task.bytesTransferred;
    }
    task.progressPercent = 100.0 * static_cast<double>(task.bytesTransferred) /
                           static_cast<double>(task.totalBytes);
  }
  return Checkpoint::Continue;
}

void Downloader::finishCancelled(const TaskHandle& handle,
                                 const std::string& destination, bool cleanup) {
  // Cleanup runs before the state flips so that anyone observing Cancelled
  // also observes the partial file gone.
  if (cleanup) {
    storage_->cleanupIncompleteDownload(destination);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it == tasks_.end() || isTerminal(it->second.state)) {
      return;
    }
    it->second.state = TaskState::Cancelled;
  }
  LOG(INFO) << "Download " << handle << " cancelled.";
}

void Downloader::finishFailed(const TaskHandle& handle,
                              const std::string& destination,
                              const std::string& error, bool cleanup) {
  if (cleanup) {
    storage_->cleanupIncompleteDownload(destination);
  }
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it == tasks_.end() || isTerminal(it->second.state)) {
      return;
    }
    DownloadTask& task = it->second;
    if (task.state == TaskState::Cancelling) {
      task.state = TaskState::Cancelled;
      cancelled = true;
    } else {
      task.state = TaskState::Failed;
      task.error = error;
    }
  }
  if (cancelled) {
    LOG(INFO) << "Download " << handle
              << " cancelled (transfer error ignored: " << error << ").";
  }
}

void Downloader::finishCompleted(const TaskHandle& handle,
                                 const std::string& destination) {
  std::optional<TaskState> leftAs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it == tasks_.end()) {
      return;
    }
    DownloadTask& task = it->second;
    if (task.state == TaskState::Downloading) {
      if (task.totalBytes > 0 && task.bytesTransferred == task.totalBytes) {
        task.progressPercent = 100.0;
      }
      task.state = TaskState::Completed;
    } else {
      leftAs = task.state;
    }
  }

  if (!leftAs) {
    LOG(INFO) << "Download " << handle << " completed: " << destination;
  } else if (*leftAs == TaskState::Cancelling) {
    // A cancel that arrived after the last checkpoint still wins.
    finishCancelled(handle, destination, true);
  } else if (!isTerminal(*leftAs)) {
    LOG(INFO) << "Download " << handle << " stream ended while "
              << taskStateName(*leftAs) << "; state left unchanged.";
  }
}

void Downloader::markWorkerExited(const TaskHandle& handle,
                                  const std::string& destination) {
  bool cancelRequested = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it == tasks_.end()) {
      return;
    }
    it->second.workerExited = true;
    cancelRequested = it->second.state == TaskState::Cancelling;
  }
  // Cancel raced with the end of a paused transfer.
  if (cancelRequested) {
    finishCancelled(handle, destination, true);
  }
}

}  // namespace dlqueue
