#ifndef DLQUEUE_TBB_MANAGER_HPP_
#define DLQUEUE_TBB_MANAGER_HPP_

#include <gflags/gflags.h>
#include <tbb/blocked_range.h>
#include <tbb/info.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "logger.hpp"

DECLARE_string(custom_tbb_parallel_control);

namespace dlqueue {
namespace utils {

struct TBBState {
  bool initialized = false;
  std::shared_ptr<tbb::task_arena> arena;
};

/**
 * @brief TBB任务管理器，按名称管理 arena，并发度由 gflags 配置
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name);

  // 在名为 tbb_name 的 arena 中并行执行 task(i)，i ∈ [start, end)。
  // 单个 task 抛出的异常会被记录并吞掉，返回失败的次数。
  template <typename IntType, typename Func>
  uint64_t ParallelFor(const std::string& tbb_name, IntType start, IntType end,
                       const Func& task);

  void Release();
  ~TBBManager();

  static std::map<std::string, int> ParseTBBParallelCountDefines(
      const std::string& cfg);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId() const;

  std::unordered_map<std::string, TBBState> task_arenas_;
  mutable std::mutex arenas_mutex_;
};

// 模板实现
template <typename IntType, typename Func>
uint64_t TBBManager::ParallelFor(const std::string& tbb_name, IntType start,
                                 IntType end, const Func& task) {
  if (!(start < end)) return 0;

  uint64_t task_id = GenerateUniqueTaskId();
  std::string unique_task_name = tbb_name + "_" + std::to_string(task_id);

  auto arena = Init(tbb_name);
  std::atomic<uint64_t> failures{0};

  LOG(DEBUG) << "[TBBManager] ParallelFor start: " << unique_task_name << " ["
             << start << "," << end << ")";
  arena->execute([&task, &failures, start, end]() {
    tbb::parallel_for(tbb::blocked_range<IntType>(start, end),
                      [&task, &failures](const tbb::blocked_range<IntType>& range) {
                        for (IntType i = range.begin(); i < range.end(); ++i) {
                          try {
                            task(i);
                          } catch (const std::exception& e) {
                            failures.fetch_add(1, std::memory_order_relaxed);
                            LOG(ERROR) << "[TBBManager] Exception in task: "
                                       << e.what();
                          }
                        }
                      });
  });
  LOG(DEBUG) << "[TBBManager] ParallelFor end: " << unique_task_name
             << " failures=" << failures.load();
  return failures.load();
}

}  // namespace utils
}  // namespace dlqueue

#endif  // DLQUEUE_TBB_MANAGER_HPP_
