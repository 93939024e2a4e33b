#include "executor/local_executor.hpp"

#include <memory>
#include <stdexcept>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {
const char kStdinFile[] = "stdin";
}  // namespace

namespace executor {

ExecutionOutcome LocalExecutor::Execute(const ExecutionRequest& request) {
  sandbox::ExecutionOptions exec_options(request.workdir, request.binary);

  // Limits. The CPU limit only backs up the wall clock one.
  exec_options.wall_limit_millis = request.timeout_millis;
  exec_options.cpu_limit_millis =
      request.timeout_millis > 0 ? request.timeout_millis + 1000 : 0;
  exec_options.memory_limit_kb = FLAGS_memory_limit_kb;
  exec_options.max_file_size_kb = FLAGS_max_file_size_kb;
  exec_options.max_files = kMaxFiles;
  exec_options.max_output_bytes = request.max_output_bytes;
  exec_options.kill_grace_millis = FLAGS_kill_grace_ms;
  if (request.canceller != nullptr) {
    exec_options.cancel_fd = request.canceller->Fd();
  }

  if (request.stdin_data) {
    exec_options.stdin_file =
        util::File::JoinPath(request.workdir, kStdinFile);
    util::File::Write(exec_options.stdin_file, *request.stdin_data);
  }

  sandbox::ExecutionInfo result;
  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create(mode_);
  if (!sb->Execute(exec_options, &result, &error_msg)) {
    throw std::runtime_error(error_msg);
  }
  VLOG(1) << request.binary << " ran for " << result.wall_time_millis
          << "ms, status " << result.status_code << ", signal "
          << result.signal;

  ExecutionOutcome outcome;
  outcome.stdout_data = std::move(result.stdout_data);
  outcome.stderr_data = std::move(result.stderr_data);
  outcome.wall_time_millis = result.wall_time_millis;
  outcome.cpu_time_millis = result.cpu_time_millis + result.sys_time_millis;
  outcome.memory_usage_kb = result.memory_usage_kb;
  outcome.truncated = result.stdout_truncated || result.stderr_truncated;
  outcome.timed_out = result.timed_out;
  outcome.cancelled = result.cancelled;
  if (!outcome.timed_out && !outcome.cancelled) {
    if (result.signal != 0) {
      outcome.signal = result.signal;
    } else {
      outcome.exit_code = result.status_code;
    }
  }
  return outcome;
}

}  // namespace executor
