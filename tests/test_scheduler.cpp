// Scheduler tests: admission, concurrency, cancellation and events

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "test_helpers.hpp"
#include "transcode_queue/logging.hpp"
#include "transcode_queue/scheduler.hpp"

namespace transcode_queue {
namespace {

using namespace std::chrono_literals;
using test_support::fake_transcoder;
using test_support::read_file;
using test_support::TempDir;
using test_support::wait_until;
using test_support::write_file;
using test_support::write_script;

/// Thread-safe log of delivered events; the log outlives the recorder so
/// late deliveries during scheduler teardown stay valid
class EventRecorder {
public:
  explicit EventRecorder(EventBus &bus) : log_(std::make_shared<Log>()) {
    auto log = log_;
    bus.subscribe([log](const JobEvent &e) {
      std::lock_guard<std::mutex> lock(log->mutex);
      log->events.push_back(e);
    });
  }

  size_t count(EventKind kind, const std::string &job_id = "") const {
    std::lock_guard<std::mutex> lock(log_->mutex);
    return std::count_if(log_->events.begin(), log_->events.end(),
                         [&](const JobEvent &e) {
                           return e.kind == kind &&
                                  (job_id.empty() || e.job_id == job_id);
                         });
  }

  std::vector<JobEvent> of_kind(EventKind kind) const {
    std::lock_guard<std::mutex> lock(log_->mutex);
    std::vector<JobEvent> out;
    for (const auto &e : log_->events) {
      if (e.kind == kind)
        out.push_back(e);
    }
    return out;
  }

private:
  struct Log {
    std::mutex mutex;
    std::vector<JobEvent> events;
  };
  std::shared_ptr<Log> log_;
};

class SchedulerTest : public ::testing::Test {
protected:
  SchedulerConfig config(const std::string &transcoder, int workers = 2) {
    SchedulerConfig cfg;
    cfg.max_concurrent_jobs = workers;
    cfg.poll_interval = 20ms;
    cfg.transcoder_path = transcoder;
    return cfg;
  }

  std::string input(const std::string &name = "input.mp4") {
    std::string path = dir_.file(name);
    write_file(path, "media");
    return path;
  }

  std::string output(const std::string &name) {
    return (dir_.path() / "out" / name).string();
  }

  static double ten_seconds(const std::string &) { return 10.0; }

  TempDir dir_;
};

TEST_F(SchedulerTest, JobRunsToCompletion) {
  TimingCollector::clear();
  Scheduler scheduler(config(fake_transcoder(dir_, "0.05")), ten_seconds);
  EventRecorder events(scheduler.events());

  std::string desired = output("song.mp3");
  ASSERT_TRUE(scheduler.add_job("a", input(), desired, ConversionParams{},
                                OverwritePolicy::UNIQUE));
  auto queued = scheduler.get_job("a");
  ASSERT_TRUE(queued);
  EXPECT_EQ(queued->status(), JobStatus::QUEUED);
  EXPECT_EQ(queued->output_path(), desired);

  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));

  auto job = scheduler.get_job("a");
  ASSERT_TRUE(job);
  EXPECT_EQ(job->status(), JobStatus::COMPLETED);
  EXPECT_DOUBLE_EQ(job->progress(), 1.0);
  ASSERT_TRUE(job->result());
  EXPECT_TRUE(job->result()->success);
  EXPECT_TRUE(job->started_at());
  EXPECT_TRUE(job->completed_at());
  EXPECT_EQ(read_file(desired), "converted\n");

  EXPECT_EQ(events.count(EventKind::JOB_STARTED, "a"), 1u);
  EXPECT_EQ(events.count(EventKind::JOB_COMPLETED, "a"), 1u);
  EXPECT_EQ(events.count(EventKind::JOB_FAILED, "a"), 0u);
  EXPECT_GE(events.count(EventKind::JOB_PROGRESS, "a"), 1u);

  auto summary = events.of_kind(EventKind::ALL_COMPLETED);
  ASSERT_TRUE(summary[0].stats);
  EXPECT_EQ(summary[0].stats->completed, 1u);

  EXPECT_EQ(TimingCollector::size(), 1u);
}

TEST_F(SchedulerTest, ExistingOutputUnderSkipPolicyIsNeverRun) {
  std::string transcoder = fake_transcoder(dir_);
  Scheduler scheduler(config(transcoder), ten_seconds);
  EventRecorder events(scheduler.events());

  std::string desired = output("song.mp3");
  std::filesystem::create_directories(dir_.path() / "out");
  write_file(desired, "original");

  ASSERT_TRUE(
      scheduler.add_job("b", input(), desired, ConversionParams{}, "skip"));
  auto job = scheduler.get_job("b");
  ASSERT_TRUE(job);
  EXPECT_EQ(job->status(), JobStatus::SKIPPED);
  EXPECT_EQ(events.count(EventKind::JOB_SKIPPED, "b"), 1u);

  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));

  EXPECT_EQ(events.count(EventKind::JOB_STARTED), 0u);
  EXPECT_EQ(read_file(desired), "original");
  EXPECT_FALSE(std::filesystem::exists(dir_.file("invocations.log")));
  EXPECT_EQ(scheduler.get_queue_stats().skipped, 1u);
}

TEST_F(SchedulerTest, UniquePolicyPicksFreshName) {
  Scheduler scheduler(config(fake_transcoder(dir_)), ten_seconds);
  std::filesystem::create_directories(dir_.path() / "out");
  write_file(output("song.mp3"), "original");

  ASSERT_TRUE(scheduler.add_job("u", input(), output("song.mp3"),
                                ConversionParams{}, OverwritePolicy::UNIQUE));
  EXPECT_EQ(scheduler.get_job("u")->output_path(), output("song (1).mp3"));
}

TEST_F(SchedulerTest, ConcurrencyStaysWithinLimit) {
  Scheduler scheduler(config(fake_transcoder(dir_, "0.1"), 2), ten_seconds);
  EventRecorder events(scheduler.events());

  std::string in = input();
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(scheduler.add_job("c" + std::to_string(i), in,
                                  output("c" + std::to_string(i) + ".mp3"),
                                  ConversionParams{}));
  }
  ASSERT_TRUE(scheduler.start_processing());

  size_t peak = 0;
  auto deadline = std::chrono::steady_clock::now() + 30s;
  while (events.count(EventKind::ALL_COMPLETED) == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    peak = std::max(peak, scheduler.get_queue_stats().running);
    std::this_thread::sleep_for(5ms);
  }
  ASSERT_EQ(events.count(EventKind::ALL_COMPLETED), 1u);

  QueueStats stats = scheduler.get_queue_stats();
  EXPECT_EQ(stats.total, 10u);
  EXPECT_EQ(stats.completed, 10u);
  EXPECT_LE(peak, 2u);
  EXPECT_GE(peak, 1u);

  /// No second summary while idle
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(events.count(EventKind::ALL_COMPLETED), 1u);
}

TEST_F(SchedulerTest, JobsAreAdmittedInQueueOrder) {
  Scheduler scheduler(config(fake_transcoder(dir_, "0"), 1), ten_seconds);
  EventRecorder events(scheduler.events());

  std::string expected;
  for (int i = 0; i < 5; ++i) {
    std::string in = input("in" + std::to_string(i) + ".mp4");
    expected += in + "\n";
    ASSERT_TRUE(scheduler.add_job("f" + std::to_string(i), in,
                                  output("f" + std::to_string(i) + ".mp3"),
                                  ConversionParams{}));
  }
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }, 30s));

  EXPECT_EQ(read_file(dir_.file("invocations.log")), expected);

  auto started = events.of_kind(EventKind::JOB_STARTED);
  ASSERT_EQ(started.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(started[i].job_id, "f" + std::to_string(i));
  }
}

TEST_F(SchedulerTest, CancelRunningJob) {
  std::string script = write_script(
      dir_, "endless.sh",
      "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
      "while true; do echo 'time=00:00:01.00' >&2; sleep 0.05 2>/dev/null; "
      "done\n");
  Scheduler scheduler(config(script), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.add_job("d", input(), output("d.mp3"),
                                ConversionParams{}));
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until([&] {
    auto job = scheduler.get_job("d");
    return job && job->status() == JobStatus::RUNNING;
  }));

  ASSERT_TRUE(scheduler.cancel_job("d"));
  EXPECT_EQ(scheduler.get_job("d")->status(), JobStatus::CANCELLED);
  EXPECT_FALSE(scheduler.cancel_job("d"));

  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));
  EXPECT_EQ(scheduler.get_job("d")->status(), JobStatus::CANCELLED);
  EXPECT_EQ(events.count(EventKind::JOB_CANCELLED, "d"), 1u);
  EXPECT_EQ(events.count(EventKind::JOB_FAILED, "d"), 0u);
  EXPECT_EQ(events.count(EventKind::JOB_COMPLETED, "d"), 0u);
}

TEST_F(SchedulerTest, CancelQueuedJobAndUnknownJob) {
  Scheduler scheduler(config(fake_transcoder(dir_)), ten_seconds);
  ASSERT_TRUE(scheduler.add_job("q", input(), output("q.mp3"),
                                ConversionParams{}));
  EXPECT_TRUE(scheduler.cancel_job("q"));
  EXPECT_EQ(scheduler.get_job("q")->status(), JobStatus::CANCELLED);
  EXPECT_FALSE(scheduler.cancel_job("q"));
  EXPECT_FALSE(scheduler.cancel_job("nope"));
}

TEST_F(SchedulerTest, CancelAllJobs) {
  Scheduler scheduler(config(fake_transcoder(dir_)), ten_seconds);
  EventRecorder events(scheduler.events());
  std::string in = input();
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(scheduler.add_job("k" + std::to_string(i), in,
                                  output("k" + std::to_string(i) + ".mp3"),
                                  ConversionParams{}));
  }

  scheduler.cancel_all_jobs();
  EXPECT_EQ(scheduler.get_queue_stats().cancelled, 3u);
  EXPECT_EQ(events.count(EventKind::JOB_CANCELLED), 3u);

  /// Nothing left to cancel
  scheduler.cancel_all_jobs();
  EXPECT_EQ(events.count(EventKind::JOB_CANCELLED), 3u);
}

TEST_F(SchedulerTest, FailedConversionCarriesExitCode) {
  std::string script =
      write_script(dir_, "failing.sh",
                   "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
                   "echo 'Unknown encoder' >&2\nexit 2\n");
  Scheduler scheduler(config(script), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.add_job("e", input(), output("e.mp3"),
                                ConversionParams{}));
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));

  auto job = scheduler.get_job("e");
  EXPECT_EQ(job->status(), JobStatus::FAILED);
  ASSERT_TRUE(job->result());
  EXPECT_EQ(job->result()->exit_code.value_or(-1), 2);
  ASSERT_TRUE(job->result()->error_code);
  EXPECT_EQ(*job->result()->error_code, ErrorCode::CONVERSION_ERROR);
  EXPECT_NE(job->error_message().find("Unknown encoder"), std::string::npos);
  EXPECT_EQ(events.count(EventKind::JOB_FAILED, "e"), 1u);
}

TEST_F(SchedulerTest, MissingOutputFailsJob) {
  std::string script = write_script(dir_, "lazy.sh", "exit 0\n");
  Scheduler scheduler(config(script), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.add_job("m", input(), output("m.mp3"),
                                ConversionParams{}));
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));

  auto job = scheduler.get_job("m");
  EXPECT_EQ(job->status(), JobStatus::FAILED);
  ASSERT_TRUE(job->result() && job->result()->error_code);
  EXPECT_EQ(*job->result()->error_code, ErrorCode::OUTPUT_MISSING);
}

TEST_F(SchedulerTest, UnavailableTranscoderReportsWorkerError) {
  Scheduler scheduler(config(dir_.file("no-such-transcoder")), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.add_job("w", input(), output("w.mp3"),
                                ConversionParams{}));
  EXPECT_FALSE(scheduler.start_processing());
  EXPECT_FALSE(scheduler.is_running());
  EXPECT_EQ(events.count(EventKind::WORKER_ERROR), 1u);
  EXPECT_EQ(scheduler.get_job("w")->status(), JobStatus::QUEUED);
}

TEST_F(SchedulerTest, AddJobValidation) {
  Scheduler scheduler(config(fake_transcoder(dir_)), ten_seconds);
  std::string in = input();

  EXPECT_FALSE(scheduler.add_job("", in, output("x.mp3"), ConversionParams{}));
  EXPECT_FALSE(scheduler.add_job("x", dir_.file("missing.mp4"), output("x.mp3"),
                                 ConversionParams{}));

  ConversionParams bad_trim;
  bad_trim.start_time = "90";
  EXPECT_FALSE(scheduler.add_job("x", in, output("x.mp3"), bad_trim));

  EXPECT_FALSE(
      scheduler.add_job("x", in, output("x.mp3"), ConversionParams{}, "merge"));

  ASSERT_TRUE(scheduler.add_job("x", in, output("x.mp3"), ConversionParams{}));
  EXPECT_FALSE(scheduler.add_job("x", in, output("y.mp3"), ConversionParams{}));
  EXPECT_EQ(scheduler.get_queue_stats().total, 1u);
}

TEST_F(SchedulerTest, BatchAdmission) {
  Scheduler scheduler(config(fake_transcoder(dir_)), ten_seconds);
  std::vector<std::string> inputs = {input("one.mp4"), input("two.mkv"),
                                     dir_.file("ghost.mp4")};
  std::string out_dir = (dir_.path() / "batch").string();

  auto results = scheduler.add_batch_jobs(inputs, out_dir, ConversionParams{});
  ASSERT_EQ(results.size(), 3u);
  size_t accepted = 0;
  for (const auto &entry : results) {
    EXPECT_EQ(entry.first.rfind("job_", 0), 0u);
    if (entry.second)
      ++accepted;
  }
  EXPECT_EQ(accepted, 2u);

  std::vector<std::string> outputs;
  for (const auto &job : scheduler.get_all_jobs()) {
    outputs.push_back(job.output_path());
  }
  ASSERT_EQ(outputs.size(), 2u);
  EXPECT_EQ(outputs[0], (dir_.path() / "batch" / "one.mp3").string());
  EXPECT_EQ(outputs[1], (dir_.path() / "batch" / "two.mp3").string());
}

TEST_F(SchedulerTest, RemoveAndClearJobs) {
  Scheduler scheduler(config(fake_transcoder(dir_, "0")), ten_seconds);
  EventRecorder events(scheduler.events());
  std::string in = input();

  ASSERT_TRUE(scheduler.add_job("r1", in, output("r1.mp3"), ConversionParams{}));
  ASSERT_TRUE(scheduler.add_job("r2", in, output("r2.mp3"), ConversionParams{}));
  EXPECT_TRUE(scheduler.remove_job("r1"));
  EXPECT_FALSE(scheduler.get_job("r1"));
  EXPECT_FALSE(scheduler.remove_job("r1"));

  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));
  EXPECT_EQ(events.count(EventKind::JOB_STARTED, "r1"), 0u);

  EXPECT_EQ(scheduler.clear_completed_jobs(), 1u);
  EXPECT_EQ(scheduler.get_queue_stats().total, 0u);
  EXPECT_TRUE(scheduler.get_all_jobs().empty());
}

TEST_F(SchedulerTest, PauseHoldsAdmission) {
  Scheduler scheduler(config(fake_transcoder(dir_, "0")), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.start_processing());
  scheduler.pause_processing();
  EXPECT_TRUE(scheduler.is_paused());

  ASSERT_TRUE(scheduler.add_job("p", input(), output("p.mp3"),
                                ConversionParams{}));
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(scheduler.get_job("p")->status(), JobStatus::QUEUED);

  scheduler.resume_processing();
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));
  EXPECT_EQ(scheduler.get_job("p")->status(), JobStatus::COMPLETED);
}

TEST_F(SchedulerTest, PauseHoldsRunningJobUntilResume) {
  Scheduler scheduler(config(fake_transcoder(dir_, "0.3")), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.add_job("h", input(), output("h.mp3"),
                                ConversionParams{}));
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until([&] {
    return scheduler.get_job("h")->status() == JobStatus::RUNNING;
  }));

  scheduler.pause_processing();
  /// The conversion itself finishes well within this window
  std::this_thread::sleep_for(1s);
  EXPECT_EQ(scheduler.get_job("h")->status(), JobStatus::RUNNING);
  EXPECT_EQ(events.count(EventKind::JOB_COMPLETED), 0u);
  EXPECT_EQ(events.count(EventKind::JOB_FAILED), 0u);
  EXPECT_EQ(events.count(EventKind::ALL_COMPLETED), 0u);

  scheduler.resume_processing();
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));
  EXPECT_EQ(scheduler.get_job("h")->status(), JobStatus::COMPLETED);
  EXPECT_EQ(events.count(EventKind::JOB_COMPLETED, "h"), 1u);
}

TEST_F(SchedulerTest, RemovingRunningJobCancelsIt) {
  std::string script = write_script(
      dir_, "endless.sh",
      "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
      "while true; do sleep 0.05 2>/dev/null; done\n");
  Scheduler scheduler(config(script), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.add_job("rm", input(), output("rm.mp3"),
                                ConversionParams{}));
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until([&] {
    return scheduler.get_job("rm")->status() == JobStatus::RUNNING;
  }));

  EXPECT_TRUE(scheduler.remove_job("rm"));
  auto job = scheduler.get_job("rm");
  ASSERT_TRUE(job);
  EXPECT_EQ(job->status(), JobStatus::CANCELLED);
  EXPECT_EQ(events.count(EventKind::JOB_CANCELLED, "rm"), 1u);

  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));
  EXPECT_EQ(scheduler.get_job("rm")->status(), JobStatus::CANCELLED);
  EXPECT_EQ(events.count(EventKind::JOB_CANCELLED, "rm"), 1u);
  EXPECT_EQ(events.count(EventKind::JOB_FAILED, "rm"), 0u);
}

TEST_F(SchedulerTest, StopCancelsRunningAndKeepsQueued) {
  std::string script = write_script(
      dir_, "endless.sh",
      "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
      "while true; do sleep 0.05 2>/dev/null; done\n");
  Scheduler scheduler(config(script, 1), ten_seconds);
  std::string in = input();

  ASSERT_TRUE(scheduler.add_job("s1", in, output("s1.mp3"), ConversionParams{}));
  ASSERT_TRUE(scheduler.add_job("s2", in, output("s2.mp3"), ConversionParams{}));
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until([&] {
    return scheduler.get_job("s1")->status() == JobStatus::RUNNING;
  }));

  scheduler.stop_processing(5s);
  EXPECT_FALSE(scheduler.is_running());
  EXPECT_EQ(scheduler.get_job("s1")->status(), JobStatus::CANCELLED);
  EXPECT_EQ(scheduler.get_job("s2")->status(), JobStatus::QUEUED);
}

TEST_F(SchedulerTest, RestartAfterImmediateStopRunsQueuedJobs) {
  std::string script = write_script(
      dir_, "selective.sh",
      "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
      "case \"$3\" in *hang*) while true; do sleep 0.05 2>/dev/null; done ;; "
      "esac\n"
      "for last in \"$@\"; do :; done\n"
      "echo converted > \"$last\"\n");
  Scheduler scheduler(config(script, 1), ten_seconds);
  EventRecorder events(scheduler.events());

  ASSERT_TRUE(scheduler.add_job("g1", input("hang.mp4"), output("g1.mp3"),
                                ConversionParams{}));
  ASSERT_TRUE(scheduler.add_job("g2", input("plain.mp4"), output("g2.mp3"),
                                ConversionParams{}));
  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until([&] {
    return scheduler.get_job("g1")->status() == JobStatus::RUNNING;
  }));

  /// A zero timeout may leave the old control loop detached
  scheduler.stop_processing(0ms);
  EXPECT_FALSE(scheduler.is_running());
  EXPECT_EQ(scheduler.get_job("g2")->status(), JobStatus::QUEUED);

  ASSERT_TRUE(scheduler.start_processing());
  ASSERT_TRUE(wait_until(
      [&] { return events.count(EventKind::ALL_COMPLETED) == 1; }));
  EXPECT_EQ(scheduler.get_job("g1")->status(), JobStatus::CANCELLED);
  EXPECT_EQ(scheduler.get_job("g2")->status(), JobStatus::COMPLETED);
  EXPECT_EQ(events.count(EventKind::JOB_STARTED, "g2"), 1u);
  EXPECT_EQ(events.count(EventKind::JOB_COMPLETED, "g2"), 1u);
  EXPECT_EQ(read_file(output("g2.mp3")), "converted\n");
}

TEST_F(SchedulerTest, StartWithEmptyQueueSendsNoSummary) {
  Scheduler scheduler(config(fake_transcoder(dir_)), ten_seconds);
  EventRecorder events(scheduler.events());
  ASSERT_TRUE(scheduler.start_processing());
  EXPECT_TRUE(scheduler.is_running());
  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(events.count(EventKind::ALL_COMPLETED), 0u);
}

} // namespace
} // namespace transcode_queue
