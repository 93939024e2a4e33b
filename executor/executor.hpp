#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <cstdint>
#include <string>

#include "absl/types/optional.h"
#include "util/canceller.hpp"

namespace executor {

struct ExecutionRequest {
  // Absolute path of the program to run.
  std::string binary;
  // Request-scoped directory the program runs in.
  std::string workdir;
  absl::optional<std::string> stdin_data;
  int64_t timeout_millis = 0;
  // Applies to stdout and stderr independently.
  int64_t max_output_bytes = 0;
  // Optional. Cancelling it ends the execution like a timeout.
  const util::Canceller* canceller = nullptr;
};

struct ExecutionOutcome {
  std::string stdout_data;
  std::string stderr_data;
  // Exactly one of exit_code and signal is set, unless the program was
  // timed out or cancelled: then neither is.
  absl::optional<int32_t> exit_code;
  absl::optional<int32_t> signal;
  int64_t wall_time_millis = 0;
  int64_t cpu_time_millis = 0;
  int64_t memory_usage_kb = 0;
  bool timed_out = false;
  bool cancelled = false;
  bool truncated = false;
};

class Executor {
 public:
  // Runs the request to completion. Throws if the program could not be
  // started at all.
  virtual ExecutionOutcome Execute(const ExecutionRequest& request) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
