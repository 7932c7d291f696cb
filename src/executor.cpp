/**
 * @file executor.cpp
 * @brief Transcoder execution implementation
 */

#include "transcode_queue/executor.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <filesystem>
#include <utility>

#include <fmt/core.h>

#include "transcode_queue/command_builder.hpp"
#include "transcode_queue/logging.hpp"
#include "transcode_queue/media_prober.hpp"
#include "transcode_queue/subprocess.hpp"

namespace transcode_queue {

namespace fs = std::filesystem;

// **----- ExecutionControl -----**

void ExecutionControl::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    if (proc_) {
      proc_->terminate();
    }
  }
  cv_.notify_all();
}

bool ExecutionControl::is_cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool ExecutionControl::wait_cancelled_for(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

void ExecutionControl::attach(Subprocess *proc) {
  std::lock_guard<std::mutex> lock(mutex_);
  proc_ = proc;
  if (cancelled_ && proc_) {
    proc_->terminate();
  }
}

void ExecutionControl::detach() {
  std::lock_guard<std::mutex> lock(mutex_);
  proc_ = nullptr;
}

// **----- Helpers -----**

namespace {

/// Detaches the process from the control before the Subprocess is destroyed
struct AttachGuard {
  ExecutionControl &control;
  AttachGuard(ExecutionControl &c, Subprocess *proc) : control(c) {
    control.attach(proc);
  }
  ~AttachGuard() { control.detach(); }
};

JobResult failure(std::string message, const char *code, double duration) {
  JobResult result;
  result.success = false;
  result.message = std::move(message);
  if (code)
    result.error_code = code;
  result.duration = duration;
  return result;
}

JobResult cancelled_result(double duration) {
  JobResult result;
  result.success = false;
  result.message = "Conversion cancelled";
  result.duration = duration;
  return result;
}

std::string join_lines(const std::deque<std::string> &lines) {
  std::string out;
  for (const auto &l : lines) {
    if (!out.empty())
      out += '\n';
    out += l;
  }
  return out;
}

} // anonymous namespace

double effective_duration(double media_duration,
                          const ConversionParams &params) {
  if (media_duration <= 0)
    return 0.0;

  double start = 0.0;
  double end = media_duration;
  double parsed = 0.0;
  if (params.start_time && time_to_seconds(*params.start_time, parsed)) {
    start = std::min(parsed, media_duration);
  }
  if (params.end_time && time_to_seconds(*params.end_time, parsed)) {
    end = std::min(parsed, media_duration);
  }
  return std::max(0.0, end - start);
}

// **----- ExecutionEngine -----**

ExecutionEngine::ExecutionEngine(std::string transcoder, int retry_attempts,
                                 double retry_backoff_sec, DurationProbe probe)
    : transcoder_(std::move(transcoder)),
      retry_attempts_(std::max(0, retry_attempts)),
      retry_backoff_sec_(std::max(0.0, retry_backoff_sec)),
      probe_(probe ? std::move(probe) : DurationProbe(probe_duration)) {}

JobResult ExecutionEngine::execute(const ExecutionRequest &request,
                                   const ProgressSink &sink,
                                   ExecutionControl &control) const {
  auto begin = std::chrono::steady_clock::now();
  auto elapsed = [&begin] {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         begin)
        .count();
  };

  JobResult result;
  for (int attempt = 0;; ++attempt) {
    result = run_once(request, sink, control);
    if (result.success || control.is_cancelled() || attempt >= retry_attempts_)
      break;

    double delay = retry_backoff_sec_ * std::pow(2.0, attempt);
    LOG_WARN("[Job {}] Attempt {} failed, retrying in {:.1f}s", request.job_id,
             attempt + 1, delay);
    if (control.wait_cancelled_for(std::chrono::milliseconds(
            static_cast<long>(delay * 1000.0)))) {
      return cancelled_result(elapsed());
    }
  }

  result.duration = elapsed();
  return result;
}

JobResult ExecutionEngine::run_once(const ExecutionRequest &request,
                                    const ProgressSink &sink,
                                    ExecutionControl &control) const {
  auto begin = std::chrono::steady_clock::now();
  auto elapsed = [&begin] {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         begin)
        .count();
  };

  if (control.is_cancelled())
    return cancelled_result(0.0);

  try {
    /// Create output directory if needed
    fs::path out(request.output_path);
    if (out.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(out.parent_path(), ec);
      if (ec) {
        LOG_ERROR("[Job {}] Cannot create {}: {}", request.job_id,
                  out.parent_path().string(), ec.message());
        return failure(fmt::format("Failed to create output directory {}: {}",
                                   out.parent_path().string(), ec.message()),
                       ErrorCode::IO_ERROR, elapsed());
      }
    }

    double total = effective_duration(probe_(request.input_path),
                                      request.params);

    auto cmd = build_command(transcoder_, request.input_path,
                             request.output_path, request.params);
    LOG_DEBUG("[Job {}] {}", request.job_id, join_command(cmd));

    Subprocess proc;
    std::string spawn_error;
    if (!proc.spawn(cmd, spawn_error)) {
      LOG_ERROR("[Job {}] {}", request.job_id, spawn_error);
      return failure(fmt::format("Failed to start conversion: {}", spawn_error),
                     ErrorCode::LAUNCH_ERROR, elapsed());
    }

    int exit_code;
    {
      AttachGuard guard(control, &proc);

      ProgressMonitor monitor(total, sink);
      std::deque<std::string> tail;
      std::string line;
      while (proc.read_line(line)) {
        LOG_DEBUG("[Job {}] {}", request.job_id, line);
        tail.push_back(line);
        if (tail.size() > ERROR_TAIL_LINES)
          tail.pop_front();
        monitor.feed(line);
      }

      exit_code = proc.wait();
      if (exit_code != 0 && !control.is_cancelled()) {
        JobResult result =
            failure(fmt::format("Conversion failed: {}", join_lines(tail)),
                    ErrorCode::CONVERSION_ERROR, elapsed());
        result.exit_code = exit_code;
        LOG_ERROR("[Job {}] Transcoder exited with status {}", request.job_id,
                  exit_code);
        return result;
      }
    }

    if (control.is_cancelled()) {
      JobResult result = cancelled_result(elapsed());
      result.exit_code = exit_code;
      return result;
    }

    /// Verify output file was created
    std::error_code ec;
    if (!fs::exists(out, ec) || fs::file_size(out, ec) == 0 || ec) {
      LOG_ERROR("[Job {}] Output missing or empty: {}", request.job_id,
                request.output_path);
      JobResult result = failure("Conversion failed: output file was not created",
                                 ErrorCode::OUTPUT_MISSING, elapsed());
      result.exit_code = exit_code;
      return result;
    }

    JobResult result;
    result.success = true;
    result.message = "Conversion completed successfully";
    result.output_path = request.output_path;
    result.exit_code = exit_code;
    result.duration = elapsed();
    return result;

  } catch (const std::exception &e) {
    LOG_ERROR("[Job {}] Unexpected error: {}", request.job_id, e.what());
    return failure(fmt::format("Unexpected error: {}", e.what()),
                   ErrorCode::UNKNOWN_ERROR, elapsed());
  }
}

bool ExecutionEngine::check_transcoder(std::string &error) const {
  Subprocess proc;
  if (!proc.spawn({transcoder_, "-version"}, error)) {
    return false;
  }

  std::string line;
  while (proc.read_line(line)) {
  }

  int code = proc.wait();
  if (code != 0) {
    error = fmt::format("{} -version exited with status {}", transcoder_, code);
    return false;
  }
  return true;
}

} // namespace transcode_queue
