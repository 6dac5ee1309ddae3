#include "timer.hpp"

#include <exception>

#include "logger.hpp"

namespace dlqueue {
namespace utils {

Timer::Timer() : running_(false), exited_(true) {}

Timer::~Timer() {
  stop();
  if (timerThread_.joinable()) {
    timerThread_.join();
  }
}

void Timer::addPeriodicTask(std::chrono::milliseconds delay,
                            std::chrono::milliseconds period,
                            std::function<void()> callback) {
  auto execution_time = std::chrono::steady_clock::now() + delay;
  TimerTask task(execution_time, std::move(callback), period);
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    taskQueue_.push(task);
    tasksCv_.notify_one();
  }
}

void Timer::start() {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  if (running_) return;  // Already running
  if (timerThread_.joinable()) {
    // 上一次 stop 超时留下的线程，必须先回收
    lock.unlock();
    timerThread_.join();
    lock.lock();
    if (running_) return;
  }
  running_ = true;
  exited_ = false;
  timerThread_ = std::thread([this]() { run(); });
}

void Timer::run() {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  while (running_) {
    if (taskQueue_.empty()) {
      tasksCv_.wait(lock, [this]() { return !taskQueue_.empty() || !running_; });
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    auto nextTask = taskQueue_.top();

    if (nextTask.execTimestamp <= now) {
      taskQueue_.pop();

      if (nextTask.period.count() > 0) {
        // 从当前时刻重新计时，回调耗时过长时不会连续补跑
        TimerTask again = nextTask;
        again.execTimestamp = now + nextTask.period;
        taskQueue_.push(std::move(again));
      }

      lock.unlock();  // Unlock before executing the callback
      try {
        nextTask.callback();
      } catch (const std::exception& e) {
        LOG(ERROR) << "[Timer] Exception in task: " << e.what();
      }
      lock.lock();
    } else {
      tasksCv_.wait_until(lock, nextTask.execTimestamp, [this, &nextTask]() {
        return !running_ ||
               (!taskQueue_.empty() &&
                taskQueue_.top().execTimestamp < nextTask.execTimestamp);
      });
    }
  }
  exited_ = true;
  exitCv_.notify_all();
}

bool Timer::stop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  running_ = false;
  tasksCv_.notify_all();  // Notify the thread to wake up and exit
  if (!timerThread_.joinable()) return true;

  if (timerThread_.get_id() == std::this_thread::get_id()) {
    // 在回调里调用 stop：不能 join 自己
    return false;
  }

  const bool exited =
      exitCv_.wait_for(lock, timeout, [this]() { return exited_; });
  lock.unlock();
  if (!exited) {
    return false;
  }
  timerThread_.join();
  return true;
}

bool Timer::isRunning() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return running_;
}

}  // namespace utils
}  // namespace dlqueue
