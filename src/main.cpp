#include <gflags/gflags.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "Downloader/CurlFetcher.hpp"
#include "Downloader/Downloader.hpp"
#include "Progress/ProgressTracker.hpp"
#include "Queue/ManifestLoader.hpp"
#include "Queue/QueueManager.hpp"
#include "Storage/StorageManager.hpp"
#include "utils/curl_global.hpp"
#include "utils/logger.hpp"
#include "utils/timer.hpp"

DEFINE_int32(workers, 5, "Number of transfers kept in flight");
DEFINE_int32(reconcile_interval_ms, 1000,
             "Interval between queue reconciliation passes");
DEFINE_int32(stop_timeout_ms, 5000,
             "How long shutdown waits for the reconciliation loop");
DEFINE_string(download_dir, "downloads", "Directory for downloaded files");
DEFINE_string(manifest, "",
              "File with one '<url> [filename|-] [priority]' request per line");
DEFINE_int32(priority, 0, "Priority for URLs given on the command line");
DEFINE_string(log_dir, "logs", "Directory for dlqueue.log");
DEFINE_uint64(log_max_file_size, 10 * 1024 * 1024,
              "Rotate the log file after this many bytes");
DEFINE_uint64(log_max_backups, 3, "Number of rotated log files to keep");
DEFINE_bool(verbose, false, "Log at DEBUG level");
DEFINE_int32(display_interval_ms, 1000,
             "Progress display refresh interval (0 disables it)");
DEFINE_bool(clear_screen, true, "Clear the terminal on every refresh");
DEFINE_int32(connect_timeout_s, 30, "Connection timeout per transfer");

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted.store(true); }

bool queueIdle(const dlqueue::QueueStatus& status) {
  return status.queuedCount == 0 && status.activeCount == 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "dlqueue [flags] <url> [<url> ...]\n"
      "Downloads every URL (and every --manifest entry) through a priority "
      "queue with --workers concurrent transfers.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc < 2 && FLAGS_manifest.empty()) {
    std::cerr << "Usage: " << argv[0]
              << " [--workers=N] [--download_dir=DIR] [--manifest=FILE] "
                 "<url> [<url> ...]"
              << std::endl;
    return 1;
  }
  if (FLAGS_workers <= 0) {
    std::cerr << "--workers must be positive" << std::endl;
    return 1;
  }

  // 日志初始化（可选：可自定义路径/大小/备份数）
  dlqueue::utils::LogConfig logCfg;
  logCfg.logFilePath = FLAGS_log_dir;
  logCfg.maxFileSize = FLAGS_log_max_file_size;
  logCfg.maxBackupFiles = FLAGS_log_max_backups;
  logCfg.minLevel =
      FLAGS_verbose ? dlqueue::utils::LogLevel::DEBUG : dlqueue::utils::LogLevel::INFO;
  // 进度面板占用终端时日志只写文件
  logCfg.toConsole = FLAGS_display_interval_ms <= 0;
  dlqueue::utils::Logger::initialize(logCfg);

  try {
    dlqueue::utils::ensureCurlInitialized();
  } catch (const std::exception& e) {
    LOG(FATAL) << e.what();
    std::cerr << e.what() << std::endl;
    return 1;
  }

  auto storage = std::make_shared<dlqueue::StorageManager>(FLAGS_download_dir);

  std::vector<dlqueue::DownloadRequest> requests;
  if (!FLAGS_manifest.empty()) {
    try {
      requests = dlqueue::ManifestLoader(*storage).load(FLAGS_manifest);
    } catch (const std::exception& e) {
      LOG(ERROR) << e.what();
      std::cerr << e.what() << std::endl;
      return 1;
    }
  }
  {
    std::vector<dlqueue::DownloadRequest> fromArgs;
    for (int i = 1; i < argc; ++i) {
      dlqueue::DownloadRequest request;
      request.url = argv[i];
      request.priority = FLAGS_priority;
      fromArgs.push_back(std::move(request));
    }
    dlqueue::ManifestLoader(*storage).resolveDestinations(fromArgs);
    for (auto& request : fromArgs) {
      requests.push_back(std::move(request));
    }
  }

  dlqueue::FetchOptions fetchOptions;
  fetchOptions.connectTimeoutSeconds = FLAGS_connect_timeout_s;
  auto fetcher = std::make_shared<dlqueue::CurlFetcher>(fetchOptions);

  dlqueue::Downloader downloader(static_cast<size_t>(FLAGS_workers), fetcher,
                                 storage);
  dlqueue::QueueManager queue(
      downloader, std::chrono::milliseconds(FLAGS_reconcile_interval_ms),
      std::chrono::milliseconds(FLAGS_stop_timeout_ms));

  for (const auto& request : requests) {
    if (request.destination.empty()) {
      LOG(WARN) << "Skipping " << request.url << ": no destination.";
      continue;
    }
    queue.add(request.url, request.destination, request.priority);
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  queue.start();

  dlqueue::ProgressTracker tracker(queue);
  dlqueue::utils::Timer display;
  if (FLAGS_display_interval_ms > 0) {
    display.addPeriodicTask(
        std::chrono::milliseconds(0),
        std::chrono::milliseconds(FLAGS_display_interval_ms),
        [&tracker]() { tracker.display(std::cout, FLAGS_clear_screen); });
    display.start();
  }

  bool cancelling = false;
  while (true) {
    const dlqueue::QueueStatus status = queue.status();
    if (queueIdle(status)) {
      break;
    }
    if (g_interrupted.load() && !cancelling) {
      cancelling = true;
      LOG(WARN) << "Interrupted, cancelling remaining downloads.";
      for (const auto& entry : status.queued) {
        queue.remove(entry.id);
      }
      for (const auto& view : status.active) {
        queue.remove(view.entry.id);
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  display.stop();
  const bool clean = queue.stop();

  const dlqueue::QueueStatus summary = queue.status();
  if (FLAGS_display_interval_ms > 0) {
    tracker.display(std::cout, false);
  }
  LOG(INFO) << "Finished: " << summary.retired.completed << " completed, "
            << summary.retired.failed << " failed, " << summary.retired.cancelled
            << " cancelled.";

  gflags::ShutDownCommandLineFlags();
  if (!clean || summary.retired.failed > 0 || summary.retired.lost > 0) {
    return 1;
  }
  return 0;
}
