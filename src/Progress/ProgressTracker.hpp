#ifndef DLQUEUE_PROGRESS_TRACKER_HPP_
#define DLQUEUE_PROGRESS_TRACKER_HPP_

#include <cstdint>
#include <ostream>
#include <string>

#include "Queue/QueueTypes.hpp"

namespace dlqueue {

class QueueManager;

// Read-only text view over QueueManager::status().
class ProgressTracker {
 public:
  explicit ProgressTracker(const QueueManager& queue) : queue_(queue) {}

  static std::string humanReadableSize(uint64_t bytes);
  static std::string render(const QueueStatus& status);

  // Writes the current report, optionally clearing the terminal first.
  void display(std::ostream& os, bool clearScreen = false) const;

 private:
  static std::string progressBar(double percent);

  const QueueManager& queue_;
};

}  // namespace dlqueue

#endif  // DLQUEUE_PROGRESS_TRACKER_HPP_
