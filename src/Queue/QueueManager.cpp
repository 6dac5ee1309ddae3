#include "QueueManager.hpp"

#include <algorithm>
#include <utility>

#include "logger.hpp"
#include "timer.hpp"

namespace dlqueue {

QueueManager::QueueManager(TransferPool& pool, std::chrono::milliseconds interval,
                           std::chrono::milliseconds stopTimeout)
    : pool_(pool),
      interval_(interval),
      stopTimeout_(stopTimeout),
      nextEntryId_(0) {}

QueueManager::~QueueManager() {
  stop();
  std::lock_guard<std::mutex> lock(timerMutex_);
  timer_.reset();
}

BacklogSnapshot QueueManager::snapshotOf(const BacklogEntry& entry) {
  BacklogSnapshot snapshot;
  snapshot.id = entry.id;
  snapshot.source = entry.source;
  snapshot.destination = entry.destination;
  snapshot.priority = entry.priority;
  snapshot.submittedAt = entry.submittedAt;
  snapshot.state = stateLabel(entry);
  return snapshot;
}

std::string QueueManager::stateLabel(const BacklogEntry& entry) {
  if (entry.mirrored) {
    return taskStateName(*entry.mirrored);
  }
  return entry.state == QueueState::Queued ? "queued" : "active";
}

void QueueManager::insertSorted(BacklogEntry entry) {
  auto pos = std::upper_bound(
      backlog_.begin(), backlog_.end(), entry,
      [](const BacklogEntry& a, const BacklogEntry& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.sequence < b.sequence;
      });
  backlog_.insert(pos, std::move(entry));
}

EntryId QueueManager::add(const std::string& source,
                          const std::string& destination, int priority) {
  EntryId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    BacklogEntry entry;
    entry.sequence = ++nextEntryId_;
    entry.id = "qm_" + std::to_string(entry.sequence);
    entry.source = source;
    entry.destination = destination;
    entry.priority = priority;
    entry.submittedAt = std::chrono::system_clock::now();
    id = entry.id;
    insertSorted(std::move(entry));
  }
  LOG(INFO) << "Added to queue (" << id << ", priority " << priority
            << "): " << source;
  return id;
}

bool QueueManager::remove(const EntryId& id) {
  std::optional<TaskHandle> toCancel;
  bool found = false;
  bool wasQueued = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto queued = std::find_if(backlog_.begin(), backlog_.end(),
                               [&id](const BacklogEntry& e) { return e.id == id; });
    if (queued != backlog_.end()) {
      backlog_.erase(queued);
      found = wasQueued = true;
    } else {
      auto active = std::find_if(
          active_.begin(), active_.end(),
          [&id](const ActiveEntry& e) { return e.entry.id == id; });
      if (active != active_.end()) {
        found = true;
        if (active->handle) {
          toCancel = active->handle;
        } else {
          // Still being handed to the pool; reconcileOnce() cancels it as
          // soon as the handle exists.
          active->withdrawRequested = true;
        }
      }
    }
  }

  if (!found) {
    LOG(WARN) << id << " not found in pending or active for removal.";
    return false;
  }
  if (wasQueued) {
    LOG(INFO) << "Removed " << id << " from pending queue.";
    return true;
  }
  if (toCancel) {
    LOG(INFO) << "Requesting cancellation for active download " << *toCancel
              << " (" << id << ").";
    pool_.cancel(*toCancel);
  }
  return true;
}

QueueStatus QueueManager::status() const {
  QueueStatus out;
  std::vector<std::pair<BacklogSnapshot, std::optional<TaskHandle>>> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.queued.reserve(backlog_.size());
    for (const auto& entry : backlog_) {
      out.queued.push_back(snapshotOf(entry));
    }
    active.reserve(active_.size());
    for (const auto& a : active_) {
      active.emplace_back(snapshotOf(a.entry), a.handle);
    }
    out.retired = retired_;
  }

  out.active.reserve(active.size());
  for (const auto& a : active) {
    std::optional<TaskSnapshot> live;
    if (a.second) {
      live = pool_.status(*a.second);
    }
    out.active.push_back(mergeEntryStatus(a.first, a.second, live));
  }
  out.queuedCount = out.queued.size();
  out.activeCount = out.active.size();
  return out;
}

EntryDetail QueueManager::statusOf(const EntryId& id) const {
  EntryDetail detail;
  detail.id = id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : backlog_) {
      if (entry.id == id) {
        detail.found = true;
        detail.state = stateLabel(entry);
        detail.details = "Pending in queue";
        return detail;
      }
    }
    for (const auto& a : active_) {
      if (a.entry.id == id) {
        detail.found = true;
        detail.state = stateLabel(a.entry);
        detail.handle = a.handle;
        detail.details = "Active in downloader";
        break;
      }
    }
  }

  if (!detail.found) {
    detail.state = kNotFound;
    detail.details = "Task not found in pending or active.";
    return detail;
  }

  std::optional<TaskSnapshot> live;
  if (detail.handle) {
    live = pool_.status(*detail.handle);
  }
  if (live) {
    detail.poolState = taskStateName(live->state);
    detail.error = live->error;
  } else {
    detail.poolState = "unknown";
  }
  return detail;
}

void QueueManager::reconcileOnce() {
  std::lock_guard<std::mutex> cycle(cycleMutex_);

  // 1. Poll the pool for every active handle, outside the queue lock.
  std::vector<std::pair<EntryId, TaskHandle>> polled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& a : active_) {
      if (a.handle) {
        polled.emplace_back(a.entry.id, *a.handle);
      }
    }
  }
  std::vector<std::optional<TaskSnapshot>> results;
  results.reserve(polled.size());
  for (const auto& item : polled) {
    results.push_back(pool_.status(item.second));
  }

  const size_t capacity = pool_.capacity();
  std::vector<TaskHandle> finished;
  std::vector<std::string> notes;
  std::vector<BacklogEntry> toDispatch;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    // 2. Copy live states in and drop entries that are done.
    std::vector<EntryId> retiring;
    for (size_t i = 0; i < polled.size(); ++i) {
      const EntryId& id = polled[i].first;
      auto it = std::find_if(
          active_.begin(), active_.end(),
          [&id](const ActiveEntry& e) { return e.entry.id == id; });
      if (it == active_.end()) {
        continue;
      }
      const auto& live = results[i];
      if (!live) {
        notes.push_back("Could not get status for " + polled[i].second + " (" +
                        id + "). Assuming it's gone.");
        ++retired_.lost;
        retiring.push_back(id);
        continue;
      }
      it->entry.mirrored = live->state;
      if (!isTerminal(live->state)) {
        continue;
      }
      switch (live->state) {
        case TaskState::Completed:
          ++retired_.completed;
          break;
        case TaskState::Failed:
          ++retired_.failed;
          break;
        default:
          ++retired_.cancelled;
          break;
      }
      std::string note = "Download " + polled[i].second + " (" + id +
                         ") finished with status: " + taskStateName(live->state);
      if (live->state == TaskState::Failed) {
        note += ", error: " + live->error;
      }
      notes.push_back(std::move(note));
      finished.push_back(polled[i].second);
      retiring.push_back(id);
    }
    active_.erase(
        std::remove_if(active_.begin(), active_.end(),
                       [&retiring](const ActiveEntry& e) {
                         return std::find(retiring.begin(), retiring.end(),
                                          e.entry.id) != retiring.end();
                       }),
        active_.end());

    // 3. Promote from the backlog up to capacity. Entries count against
    // capacity from here on, before the pool has issued their handles.
    while (active_.size() < capacity && !backlog_.empty()) {
      BacklogEntry entry = std::move(backlog_.front());
      backlog_.erase(backlog_.begin());
      entry.state = QueueState::Active;
      entry.mirrored.reset();
      toDispatch.push_back(entry);
      ActiveEntry active;
      active.entry = std::move(entry);
      active_.push_back(std::move(active));
    }
  }

  for (const auto& note : notes) {
    LOG(INFO) << note;
  }
  for (const auto& handle : finished) {
    pool_.retire(handle);
  }

  for (const auto& entry : toDispatch) {
    LOG(INFO) << "Dispatching " << entry.id << ": " << entry.source;
    const std::optional<TaskHandle> handle =
        pool_.submit(entry.source, entry.destination);

    bool withdraw = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = std::find_if(
          active_.begin(), active_.end(),
          [&entry](const ActiveEntry& e) { return e.entry.id == entry.id; });
      if (it == active_.end()) {
        continue;
      }
      if (!handle) {
        BacklogEntry requeued = std::move(it->entry);
        const bool withdrawn = it->withdrawRequested;
        active_.erase(it);
        if (!withdrawn) {
          requeued.state = QueueState::Queued;
          insertSorted(std::move(requeued));
        }
      } else {
        it->handle = handle;
        withdraw = it->withdrawRequested;
      }
    }

    if (!handle) {
      LOG(WARN) << "Downloader did not start " << entry.id << ". Re-queueing.";
      continue;
    }
    LOG(INFO) << "Dispatched " << entry.id << " as " << *handle << ".";
    if (withdraw) {
      pool_.cancel(*handle);
    }
  }
}

void QueueManager::start() {
  std::lock_guard<std::mutex> lock(timerMutex_);
  if (timer_) {
    if (timer_->isRunning()) {
      LOG(INFO) << "Processing loop already running.";
      return;
    }
    // 上一次 stop 超时，旧线程可能还卡在某次 reconcileOnce 里，不能在这里等它
    if (!timer_->stop(std::chrono::milliseconds(0))) {
      LOG(WARN) << "Previous processing loop has not exited yet. Not starting.";
      return;
    }
    timer_.reset();
  }
  timer_ = std::make_unique<utils::Timer>();
  timer_->addPeriodicTask(std::chrono::milliseconds(0), interval_,
                          [this]() { reconcileOnce(); });
  timer_->start();
  LOG(INFO) << "Started processing queue (interval " << interval_.count()
            << " ms).";
}

bool QueueManager::stop() {
  std::lock_guard<std::mutex> lock(timerMutex_);
  if (!timer_) {
    return true;
  }
  if (!timer_->stop(stopTimeout_)) {
    LOG(WARN) << "Processing loop did not stop within " << stopTimeout_.count()
              << " ms.";
    return false;
  }
  timer_.reset();
  LOG(INFO) << "Queue processing stopped.";
  return true;
}

bool QueueManager::isRunning() const {
  std::lock_guard<std::mutex> lock(timerMutex_);
  return timer_ && timer_->isRunning();
}

}  // namespace dlqueue
