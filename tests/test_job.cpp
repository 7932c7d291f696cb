// Job state machine unit tests

#include <gtest/gtest.h>

#include "transcode_queue/job.hpp"

namespace transcode_queue {
namespace {

Job make_job() { return Job("job-1", "in.mp4", "out.mp3", ConversionParams{}); }

JobResult ok_result() {
  JobResult r;
  r.success = true;
  r.message = "done";
  r.output_path = "out.mp3";
  return r;
}

JobResult failed_result() {
  JobResult r;
  r.success = false;
  r.message = "Conversion failed: boom";
  r.error_code = "CONVERSION_ERROR";
  r.exit_code = 1;
  return r;
}

TEST(JobTest, StartsQueued) {
  Job job = make_job();
  EXPECT_EQ(job.status(), JobStatus::QUEUED);
  EXPECT_DOUBLE_EQ(job.progress(), 0.0);
  EXPECT_FALSE(job.started_at());
  EXPECT_FALSE(job.completed_at());
  EXPECT_FALSE(job.result());
}

TEST(JobTest, SuccessfulLifecycle) {
  Job job = make_job();
  ASSERT_TRUE(job.start());
  EXPECT_EQ(job.status(), JobStatus::RUNNING);
  EXPECT_TRUE(job.started_at());

  EXPECT_TRUE(job.update_progress(0.4));
  ASSERT_TRUE(job.finish(ok_result()));
  EXPECT_EQ(job.status(), JobStatus::COMPLETED);
  EXPECT_DOUBLE_EQ(job.progress(), 1.0);
  ASSERT_TRUE(job.result());
  EXPECT_TRUE(job.result()->success);
  EXPECT_TRUE(job.completed_at());
}

TEST(JobTest, FailureRecordsMessage) {
  Job job = make_job();
  job.start();
  ASSERT_TRUE(job.finish(failed_result()));
  EXPECT_EQ(job.status(), JobStatus::FAILED);
  EXPECT_EQ(job.error_message(), "Conversion failed: boom");
  EXPECT_EQ(job.result()->exit_code.value_or(-1), 1);
}

TEST(JobTest, IllegalTransitionsAreRejected) {
  Job job = make_job();
  EXPECT_FALSE(job.finish(ok_result()));
  EXPECT_FALSE(job.update_progress(0.5));

  job.start();
  EXPECT_FALSE(job.start());
}

TEST(JobTest, TerminalStateIsImmutable) {
  Job job = make_job();
  job.start();
  job.finish(failed_result());
  auto completed = job.completed_at();

  EXPECT_FALSE(job.cancel());
  EXPECT_FALSE(job.start());
  EXPECT_FALSE(job.finish(ok_result()));
  EXPECT_FALSE(job.update_progress(0.9));

  EXPECT_EQ(job.status(), JobStatus::FAILED);
  EXPECT_TRUE(job.completed_at() == completed);
  EXPECT_FALSE(job.result()->success);
}

TEST(JobTest, CancelFromQueuedAndRunning) {
  Job queued = make_job();
  EXPECT_TRUE(queued.cancel());
  EXPECT_EQ(queued.status(), JobStatus::CANCELLED);
  EXPECT_FALSE(queued.cancel());

  Job running = make_job();
  running.start();
  EXPECT_TRUE(running.cancel());
  EXPECT_EQ(running.status(), JobStatus::CANCELLED);
  /// A late result does not overwrite the cancellation
  EXPECT_FALSE(running.finish(ok_result()));
  EXPECT_EQ(running.status(), JobStatus::CANCELLED);
}

TEST(JobTest, SkippedJobIsTerminal) {
  Job job = Job::skipped("job-2", "in.mp4", "out.mp3", ConversionParams{},
                         "File already exists: out.mp3");
  EXPECT_EQ(job.status(), JobStatus::SKIPPED);
  EXPECT_TRUE(is_terminal(job.status()));
  EXPECT_TRUE(job.completed_at());
  EXPECT_EQ(job.error_message(), "File already exists: out.mp3");
  EXPECT_FALSE(job.start());
}

TEST(JobTest, ProgressOnlyMovesForward) {
  Job job = make_job();
  job.start();
  EXPECT_TRUE(job.update_progress(0.5));
  EXPECT_FALSE(job.update_progress(0.3));
  EXPECT_FALSE(job.update_progress(0.5));
  EXPECT_TRUE(job.update_progress(2.0));
  EXPECT_DOUBLE_EQ(job.progress(), 1.0);
}

TEST(JobTest, EventsAreMarkedOnce) {
  Job job = make_job();
  EXPECT_FALSE(job.was_emitted(EventKind::JOB_STARTED));
  EXPECT_TRUE(job.mark_emitted(EventKind::JOB_STARTED));
  EXPECT_FALSE(job.mark_emitted(EventKind::JOB_STARTED));
  EXPECT_TRUE(job.was_emitted(EventKind::JOB_STARTED));
  EXPECT_TRUE(job.mark_emitted(EventKind::JOB_COMPLETED));
}

TEST(JobTest, ElapsedAndEta) {
  Job job = make_job();
  EXPECT_DOUBLE_EQ(job.elapsed_seconds(), 0.0);
  EXPECT_FALSE(job.eta_seconds());

  auto t0 = Clock::now();
  job.start(t0);
  job.update_progress(0.25);

  auto later = t0 + std::chrono::seconds(10);
  EXPECT_NEAR(job.elapsed_seconds(later), 10.0, 1e-6);
  auto eta = job.eta_seconds(later);
  ASSERT_TRUE(eta);
  EXPECT_NEAR(*eta, 30.0, 1e-6);

  job.finish(ok_result(), t0 + std::chrono::seconds(12));
  EXPECT_NEAR(job.elapsed_seconds(t0 + std::chrono::seconds(100)), 12.0, 1e-6);
  EXPECT_FALSE(job.eta_seconds());
}

} // namespace
} // namespace transcode_queue
