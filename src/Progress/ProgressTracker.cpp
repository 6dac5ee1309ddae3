#include "ProgressTracker.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "Queue/QueueManager.hpp"

namespace dlqueue {

namespace {
constexpr int kBarWidth = 30;
}  // namespace

std::string ProgressTracker::humanReadableSize(uint64_t bytes) {
  if (bytes == 0) {
    return "0B";
  }
  static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
  constexpr size_t kUnitCount = sizeof(kUnits) / sizeof(kUnits[0]);

  double size = static_cast<double>(bytes);
  size_t unit = 0;
  while (size >= 1024.0 && unit < kUnitCount - 1) {
    size /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << size << kUnits[unit];
  return oss.str();
}

std::string ProgressTracker::progressBar(double percent) {
  const double clamped = std::min(100.0, std::max(0.0, percent));
  const int filled = static_cast<int>(kBarWidth * clamped / 100.0);
  std::string bar;
  bar.reserve(static_cast<size_t>(kBarWidth) * 3);
  for (int i = 0; i < kBarWidth; ++i) {
    bar += (i < filled) ? u8"█" : "-";
  }
  return bar;
}

std::string ProgressTracker::render(const QueueStatus& status) {
  std::ostringstream oss;
  oss << "--- Download Progress ---\n";

  oss << "\n== Pending Tasks ==\n";
  if (status.queued.empty()) {
    oss << "  No tasks in queue.\n";
  }
  for (const auto& entry : status.queued) {
    oss << "  ID (QM): " << entry.id << " | URL: " << entry.source
        << " | Status: " << entry.state << " | Priority: " << entry.priority
        << "\n";
  }

  oss << "\n== Active Downloads ==\n";
  if (status.active.empty()) {
    oss << "  No active downloads.\n";
  }
  for (const auto& view : status.active) {
    const std::string handle = view.handle ? *view.handle : "N/A";
    if (!view.live) {
      // Not handed to the pool yet, or the pool already forgot it.
      const std::string state =
          view.liveState.empty() ? "checking..." : view.liveState;
      oss << "  ID (QM): " << view.entry.id << " | Downloader ID: " << handle
          << " | URL: " << view.entry.source << " | Status: " << state << "\n";
      continue;
    }

    const TaskSnapshot& live = *view.live;
    std::string label = view.liveState;
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    oss << "  ID (QM): " << view.entry.id << " | Downloader ID: " << handle
        << " | " << label << "\n";
    oss << "     URL: " << view.entry.source << "\n";
    oss << "     " << progressBar(live.progressPercent) << " " << std::fixed
        << std::setprecision(2) << live.progressPercent << "%\n";
    oss << "     " << humanReadableSize(live.bytesTransferred) << " / "
        << (live.totalBytes > 0 ? humanReadableSize(live.totalBytes) : "N/A")
        << "\n";
    if (!live.error.empty()) {
      oss << "     Error: " << live.error << "\n";
    }
  }

  const RetiredCounts& r = status.retired;
  if (r.total() > 0) {
    oss << "\nFinished: " << r.completed << " completed, " << r.failed
        << " failed, " << r.cancelled << " cancelled";
    if (r.lost > 0) {
      oss << ", " << r.lost << " lost";
    }
    oss << "\n";
  }
  oss << "\n--- End of Report ---\n";
  return oss.str();
}

void ProgressTracker::display(std::ostream& os, bool clearScreen) const {
  if (clearScreen) {
    os << "\033[2J\033[H";
  }
  os << render(queue_.status()) << std::flush;
}

}  // namespace dlqueue
