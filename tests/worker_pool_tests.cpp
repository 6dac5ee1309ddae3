// Worker pool tests against a scripted fetcher (run via CTest).
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Downloader/Downloader.hpp"
#include "FakeFetcher.hpp"
#include "Storage/StorageManager.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using dlqueue::Downloader;
using dlqueue::TaskHandle;
using dlqueue::TaskSnapshot;
using dlqueue::TaskState;
using dlqueue::testing::FakeFetcher;
using dlqueue::testing::FetchScript;
using dlqueue::testing::ScratchDir;
using dlqueue::testing::TestContext;
using dlqueue::testing::waitFor;

namespace {

struct Fixture {
  ScratchDir dir{"pool"};
  std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
  std::shared_ptr<dlqueue::StorageManager> storage =
      std::make_shared<dlqueue::StorageManager>(dir.file("downloads"));
  Downloader pool{3, fetcher, storage};
};

bool reaches(Downloader& pool, const TaskHandle& h, TaskState want) {
  return waitFor([&]() {
    auto s = pool.status(h);
    return s && s->state == want;
  });
}

bool nearly(double a, double b) { return std::fabs(a - b) < 1e-9; }

void test_completes_with_declared_size(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.totalBytes = 100;
  s.chunks = {"abcdef", "ghijkl"};
  f.fetcher->script("http://h/a.bin", s);

  const std::string dest = f.dir.file("out/a.bin");
  auto h = f.pool.submit("http://h/a.bin", dest);
  t.check(h.has_value(), "submit should return a handle");
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Completed), "transfer should complete");

  auto snap = f.pool.status(*h);
  t.check(snap && snap->bytesTransferred == 12, "12 bytes should be recorded");
  t.check(snap && snap->totalBytes == 100, "declared total should be kept");
  t.check(snap && nearly(snap->progressPercent, 12.0),
          "progress should be 12.0 for 12 of 100 bytes");
  t.check(snap && snap->error.empty(), "completed task has no error");
  t.check(dlqueue::testing::readFile(dest) == "abcdefghijkl",
          "destination should hold the streamed bytes");
}

void test_full_transfer_reaches_hundred_percent(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.totalBytes = 8;
  s.chunks = {"1234", "5678"};
  s.chunkDelay = std::chrono::milliseconds(5);
  f.fetcher->script("http://h/full", s);

  auto h = f.pool.submit("http://h/full", f.dir.file("full"));
  if (!h) {
    t.check(false, "submit should return a handle");
    return;
  }

  // Every observed snapshot keeps the progress invariant.
  bool invariantHeld = true;
  waitFor([&]() {
    auto snap = f.pool.status(*h);
    if (!snap) return true;
    if (snap->totalBytes > 0) {
      if (snap->bytesTransferred > snap->totalBytes) invariantHeld = false;
      const double expected = 100.0 * static_cast<double>(snap->bytesTransferred) /
                              static_cast<double>(snap->totalBytes);
      if (!nearly(snap->progressPercent, expected)) invariantHeld = false;
    }
    return dlqueue::isTerminal(snap->state);
  });
  t.check(invariantHeld, "progress should equal 100*bytes/total in every snapshot");

  auto snap = f.pool.status(*h);
  t.check(snap && snap->state == TaskState::Completed, "transfer should complete");
  t.check(snap && nearly(snap->progressPercent, 100.0),
          "complete transfer should report 100%");
}

void test_under_reported_size_raises_total(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.totalBytes = 4;
  s.chunks = {"abcdef"};
  f.fetcher->script("http://h/short", s);

  auto h = f.pool.submit("http://h/short", f.dir.file("short"));
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Completed), "transfer should complete");
  auto snap = f.pool.status(*h);
  t.check(snap && snap->totalBytes == 6, "total should grow to the bytes received");
  t.check(snap && nearly(snap->progressPercent, 100.0), "progress capped at 100");
}

void test_unknown_total_leaves_progress(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.chunks = {"abc"};
  f.fetcher->script("http://h/nolen", s);

  auto h = f.pool.submit("http://h/nolen", f.dir.file("nolen"));
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Completed), "transfer should complete");
  auto snap = f.pool.status(*h);
  t.check(snap && snap->totalBytes == 0, "unknown total stays 0");
  t.check(snap && snap->bytesTransferred == 3, "bytes still counted");
  t.check(snap && nearly(snap->progressPercent, 0.0),
          "progress untouched without a total");
}

void test_transport_error_fails_and_cleans_up(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.totalBytes = 100;
  s.chunks = {"partial"};
  s.streamError = "connection reset";
  f.fetcher->script("http://h/broken", s);

  const std::string dest = f.dir.file("broken.bin");
  auto h = f.pool.submit("http://h/broken", dest);
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Failed), "transfer should fail");
  auto snap = f.pool.status(*h);
  t.check(snap && snap->error == "connection reset",
          "error should carry the transport message");
  t.check(!fs::exists(dest), "partial file should be removed on failure");
}

void test_open_error_fails(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.openError = "HTTP 500";
  f.fetcher->script("http://h/500", s);

  const std::string dest = f.dir.file("500.bin");
  auto h = f.pool.submit("http://h/500", dest);
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Failed), "transfer should fail");
  auto snap = f.pool.status(*h);
  t.check(snap && snap->error == "HTTP 500", "error should be the open failure");
  t.check(!fs::exists(dest), "no empty destination left behind");
}

void test_prepare_failure_skips_fetch(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.chunks = {"x"};
  f.fetcher->script("http://h/x", s);

  const std::string blocker = f.dir.file("blocker");
  { std::ofstream(blocker) << "file, not a directory"; }

  auto h = f.pool.submit("http://h/x", blocker + "/sub/x.bin");
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Failed), "transfer should fail");
  auto snap = f.pool.status(*h);
  t.checkContains(snap ? snap->error : "", "File/Directory error",
                  "prepare failure should be labelled as such");
  t.check(f.fetcher->opened() == 0, "fetch should not start without a destination");
  t.check(fs::exists(blocker), "unrelated file must not be touched");
}

void test_cancel_while_downloading(TestContext& t) {
  Fixture f;
  auto hold = std::make_shared<std::atomic<bool>>(false);
  FetchScript s;
  s.totalBytes = 100;
  s.chunks = {"abcdef"};
  s.hold = hold;
  f.fetcher->script("http://h/slow", s);

  const std::string dest = f.dir.file("slow.bin");
  auto h = f.pool.submit("http://h/slow", dest);
  if (!h) return;
  t.check(waitFor([&]() {
            auto snap = f.pool.status(*h);
            return snap && snap->bytesTransferred == 6;
          }),
          "first chunk should arrive");
  t.check(f.pool.cancel(*h), "cancel of a live task should succeed");

  bool fileGoneWhenCancelled = false;
  t.check(waitFor([&]() {
            auto snap = f.pool.status(*h);
            if (snap && snap->state == TaskState::Cancelled) {
              fileGoneWhenCancelled = !fs::exists(dest);
              return true;
            }
            return false;
          }),
          "task should reach Cancelled");
  t.check(fileGoneWhenCancelled, "partial file gone once Cancelled is visible");
  hold->store(true);
}

void test_cancel_terminal_task(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.openError = "refused";
  f.fetcher->script("http://h/refused", s);

  auto h = f.pool.submit("http://h/refused", f.dir.file("r"));
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Failed), "transfer should fail first");
  t.check(f.pool.cancel(*h), "cancel of a terminal task still succeeds");
  auto snap = f.pool.status(*h);
  t.check(snap && snap->state == TaskState::Cancelled,
          "terminal task should be recorded as Cancelled");
  t.check(snap && snap->error.empty(), "error cleared once Cancelled");
}

void test_pause_and_resume(TestContext& t) {
  Fixture f;
  auto hold = std::make_shared<std::atomic<bool>>(false);
  FetchScript s;
  s.totalBytes = 10;
  s.chunks = {"ab"};
  s.hold = hold;
  f.fetcher->script("http://h/p", s);

  const std::string dest = f.dir.file("p.bin");
  auto h = f.pool.submit("http://h/p", dest);
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Downloading), "task should start");
  t.check(f.pool.pause(*h), "pause from Downloading should succeed");
  t.check(f.pool.status(*h)->state == TaskState::Paused, "state should be Paused");
  t.check(!f.pool.pause(*h), "pausing twice should fail");
  t.check(f.pool.resume(*h), "resume from Paused should succeed");
  t.check(f.pool.status(*h)->state == TaskState::Pending, "resume goes to Pending");
  t.check(!f.pool.resume(*h), "resume from Pending should fail");

  t.check(f.pool.cancel(*h), "cancel after resume should succeed");
  t.check(reaches(f.pool, *h, TaskState::Cancelled), "paused task can be cancelled");
  t.check(!f.pool.pause(*h), "pause of a terminal task should fail");
  t.check(!fs::exists(dest), "cancelled transfer leaves no file");
  hold->store(true);
}

void test_cancel_completed_task_keeps_file(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.totalBytes = 6;
  s.chunks = {"abc", "def"};
  f.fetcher->script("http://h/done", s);

  const std::string dest = f.dir.file("done.bin");
  auto h = f.pool.submit("http://h/done", dest);
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Completed), "transfer should complete");
  t.check(f.pool.cancel(*h), "cancel of a completed task succeeds");

  auto snap = f.pool.status(*h);
  t.check(snap && snap->state == TaskState::Cancelled,
          "completed task is recorded as Cancelled");
  t.check(snap && snap->bytesTransferred == 6, "progress is left as it was");
  t.check(dlqueue::testing::readFile(dest) == "abcdef",
          "cancelling a finished task does not remove its file");
  t.check(f.fetcher->opened() == 1, "no second fetch is started");
}

void test_stream_ends_while_paused_then_cancel(TestContext& t) {
  Fixture f;
  auto hold = std::make_shared<std::atomic<bool>>(false);
  FetchScript s;
  s.totalBytes = 100;
  s.chunks = {"abcdef"};
  s.hold = hold;
  f.fetcher->script("http://h/paused", s);

  const std::string dest = f.dir.file("paused.bin");
  auto h = f.pool.submit("http://h/paused", dest);
  if (!h) return;
  t.check(waitFor([&]() {
            auto snap = f.pool.status(*h);
            return snap && snap->bytesTransferred == 6;
          }),
          "first chunk should arrive");
  t.check(f.pool.pause(*h), "pause while downloading");
  hold->store(true);
  t.check(waitFor([&]() { return f.fetcher->closed() == 1; }),
          "stream should end while paused");

  auto snap = f.pool.status(*h);
  t.check(snap && snap->state == TaskState::Paused,
          "stream end leaves a paused task paused");
  t.check(dlqueue::testing::readFile(dest) == "abcdef",
          "received bytes stay on disk while paused");

  t.check(f.pool.cancel(*h), "cancel of a paused task succeeds");
  bool fileGoneWhenCancelled = false;
  t.check(waitFor([&]() {
            auto now = f.pool.status(*h);
            if (now && now->state == TaskState::Cancelled) {
              fileGoneWhenCancelled = !fs::exists(dest);
              return true;
            }
            return false;
          }),
          "paused task with no worker left reaches Cancelled");
  t.check(fileGoneWhenCancelled, "partial file gone once Cancelled is visible");
}

void test_stream_ends_while_pending(TestContext& t) {
  Fixture f;
  auto hold = std::make_shared<std::atomic<bool>>(false);
  FetchScript s;
  s.chunks = {"xy"};
  s.hold = hold;
  f.fetcher->script("http://h/pending", s);

  const std::string dest = f.dir.file("pending.bin");
  auto h = f.pool.submit("http://h/pending", dest);
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Downloading), "task should start");
  t.check(f.pool.pause(*h) && f.pool.resume(*h), "pause then resume");
  t.check(f.pool.pause(*h), "pause from Pending succeeds");
  t.check(f.pool.resume(*h), "resume back to Pending");

  hold->store(true);
  t.check(waitFor([&]() { return f.fetcher->closed() == 1; }),
          "stream should end while pending");
  auto snap = f.pool.status(*h);
  t.check(snap && snap->state == TaskState::Pending,
          "stream end leaves a pending task pending");
  t.check(!f.pool.retire(*h), "a task left pending cannot be retired");

  t.check(f.pool.cancel(*h), "cancel of the pending task succeeds");
  t.check(reaches(f.pool, *h, TaskState::Cancelled), "task reaches Cancelled");
  t.check(!fs::exists(dest), "destination removed on cancel");
}

void test_unexpected_error_fails_and_cleans_up(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.totalBytes = 10;
  s.chunks = {"abc"};
  s.internalError = "decoder exploded";
  f.fetcher->script("http://h/odd", s);

  const std::string dest = f.dir.file("odd.bin");
  auto h = f.pool.submit("http://h/odd", dest);
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Failed), "transfer should fail");
  auto snap = f.pool.status(*h);
  t.check(snap && snap->error ==
                      "Unexpected error during download: decoder exploded",
          "unexpected errors are labelled as such");
  t.check(!fs::exists(dest), "partial file removed after an unexpected error");
}

void test_unknown_handle(TestContext& t) {
  Fixture f;
  t.check(!f.pool.status("dl_999").has_value(), "unknown handle has no status");
  t.check(!f.pool.cancel("dl_999"), "cancel of unknown handle fails");
  t.check(!f.pool.pause("dl_999"), "pause of unknown handle fails");
  t.check(!f.pool.resume("dl_999"), "resume of unknown handle fails");
  t.check(!f.pool.retire("dl_999"), "retire of unknown handle fails");
}

void test_handles_and_capacity(TestContext& t) {
  Fixture f;
  FetchScript s;
  s.chunks = {"z"};
  f.fetcher->script("http://h/z", s);

  t.check(f.pool.capacity() == 3, "capacity should be the worker count");
  auto a = f.pool.submit("http://h/z", f.dir.file("z1"));
  auto b = f.pool.submit("http://h/z", f.dir.file("z2"));
  t.check(a && b && *a != *b, "handles should be distinct");
  t.check(a && a->rfind("dl_", 0) == 0, "handles are prefixed dl_");
  t.check(f.pool.listTasks().size() == 2, "both tasks should be listed");
  if (a) reaches(f.pool, *a, TaskState::Completed);
  if (b) reaches(f.pool, *b, TaskState::Completed);
}

void test_retire(TestContext& t) {
  Fixture f;
  auto hold = std::make_shared<std::atomic<bool>>(false);
  FetchScript s;
  s.chunks = {"q"};
  s.hold = hold;
  f.fetcher->script("http://h/q", s);

  auto h = f.pool.submit("http://h/q", f.dir.file("q"));
  if (!h) return;
  t.check(reaches(f.pool, *h, TaskState::Downloading), "task should start");
  t.check(!f.pool.retire(*h), "live task cannot be retired");
  hold->store(true);
  t.check(reaches(f.pool, *h, TaskState::Completed), "task should complete");
  t.check(f.pool.retire(*h), "terminal task can be retired");
  t.check(!f.pool.status(*h).has_value(), "retired handle is forgotten");
}

void test_destructor_cancels_live_tasks(TestContext& t) {
  ScratchDir dir("pool_dtor");
  auto fetcher = std::make_shared<FakeFetcher>();
  auto storage = std::make_shared<dlqueue::StorageManager>(dir.file("d"));
  auto hold = std::make_shared<std::atomic<bool>>(false);
  FetchScript s;
  s.chunks = {"abc"};
  s.hold = hold;
  fetcher->script("http://h/forever", s);

  const std::string dest = dir.file("forever.bin");
  {
    Downloader pool(1, fetcher, storage);
    auto h = pool.submit("http://h/forever", dest);
    t.check(h && reaches(pool, *h, TaskState::Downloading), "task should start");
  }
  t.check(!fs::exists(dest), "pool shutdown cancels and cleans up");
}

void test_destructor_cleans_up_paused_task(TestContext& t) {
  ScratchDir dir("pool_dtor_paused");
  auto fetcher = std::make_shared<FakeFetcher>();
  auto storage = std::make_shared<dlqueue::StorageManager>(dir.file("d"));
  auto hold = std::make_shared<std::atomic<bool>>(false);
  FetchScript s;
  s.chunks = {"abc"};
  s.hold = hold;
  fetcher->script("http://h/idle", s);

  const std::string dest = dir.file("idle.bin");
  {
    Downloader pool(1, fetcher, storage);
    auto h = pool.submit("http://h/idle", dest);
    t.check(h && reaches(pool, *h, TaskState::Downloading), "task should start");
    if (h) pool.pause(*h);
    hold->store(true);
    t.check(waitFor([&]() { return fetcher->closed() == 1; }),
            "stream should end while paused");
    t.check(fs::exists(dest), "file kept while the task is paused");
  }
  t.check(!fs::exists(dest), "pool shutdown removes a paused task's file");
}

}  // namespace

int main() {
  ScratchDir logs("pool_logs");
  dlqueue::testing::quietLogging(logs.path().string());

  TestContext t;
  test_completes_with_declared_size(t);
  test_full_transfer_reaches_hundred_percent(t);
  test_under_reported_size_raises_total(t);
  test_unknown_total_leaves_progress(t);
  test_transport_error_fails_and_cleans_up(t);
  test_open_error_fails(t);
  test_prepare_failure_skips_fetch(t);
  test_cancel_while_downloading(t);
  test_cancel_terminal_task(t);
  test_pause_and_resume(t);
  test_cancel_completed_task_keeps_file(t);
  test_stream_ends_while_paused_then_cancel(t);
  test_stream_ends_while_pending(t);
  test_unexpected_error_fails_and_cleans_up(t);
  test_unknown_handle(t);
  test_handles_and_capacity(t);
  test_retire(t);
  test_destructor_cancels_live_tasks(t);
  test_destructor_cleans_up_paused_task(t);
  return dlqueue::testing::report(t, "worker_pool_tests");
}
