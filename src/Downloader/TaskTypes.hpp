#ifndef DLQUEUE_TASK_TYPES_HPP_
#define DLQUEUE_TASK_TYPES_HPP_

#include <cstdint>
#include <string>

namespace dlqueue {

using TaskHandle = std::string;

enum class TaskState {
  Pending,
  Downloading,
  Paused,
  Cancelling,
  Cancelled,
  Completed,
  Failed
};

// Lower-case label used in logs and in the queue's status views.
const char* taskStateName(TaskState state);

inline bool isTerminal(TaskState state) {
  return state == TaskState::Completed || state == TaskState::Failed ||
         state == TaskState::Cancelled;
}

// Immutable copy of a task record, taken under the pool lock.
struct TaskSnapshot {
  TaskHandle handle;
  std::string source;
  std::string destination;
  TaskState state = TaskState::Pending;
  uint64_t bytesTransferred = 0;
  uint64_t totalBytes = 0;  // 0 means unknown
  double progressPercent = 0.0;
  std::string error;  // only set when state == Failed
};

}  // namespace dlqueue

#endif  // DLQUEUE_TASK_TYPES_HPP_
