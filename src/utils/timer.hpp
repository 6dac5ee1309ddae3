#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace dlqueue {
namespace utils {

// 单线程定时器：所有回调在同一个线程上串行执行，回调之间不会重叠。
class Timer {
 public:
  struct TimerTask {
    std::chrono::steady_clock::time_point execTimestamp;
    std::function<void()> callback;
    std::chrono::milliseconds period;

    TimerTask(std::chrono::steady_clock::time_point execTime,
              std::function<void()> cb, std::chrono::milliseconds periodDuration)
        : execTimestamp(execTime),
          callback(std::move(cb)),
          period(periodDuration) {}
    bool operator>(const TimerTask& other) const {
      return execTimestamp > other.execTimestamp;
    }
  };

  Timer();
  ~Timer();

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  void addPeriodicTask(std::chrono::milliseconds delay,
                       std::chrono::milliseconds period,
                       std::function<void()> callback);
  void start();

  // 唤醒并等待定时器线程退出，最多等待 timeout。
  // 线程在超时内退出返回 true；否则返回 false，线程留到析构时再 join。
  bool stop(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  bool isRunning() const;

 private:
  void run();

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  mutable std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::condition_variable exitCv_;
  std::thread timerThread_;
  bool running_;
  bool exited_;
};

}  // namespace utils
}  // namespace dlqueue
