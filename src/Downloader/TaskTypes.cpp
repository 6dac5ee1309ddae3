#include "TaskTypes.hpp"

namespace dlqueue {

const char* taskStateName(TaskState state) {
  switch (state) {
    case TaskState::Pending:
      return "pending";
    case TaskState::Downloading:
      return "downloading";
    case TaskState::Paused:
      return "paused";
    case TaskState::Cancelling:
      return "cancelling";
    case TaskState::Cancelled:
      return "cancelled";
    case TaskState::Completed:
      return "completed";
    case TaskState::Failed:
      return "failed";
  }
  return "unknown";
}

}  // namespace dlqueue
