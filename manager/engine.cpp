#include "manager/engine.hpp"

#include <chrono>
#include <cstring>
#include <stdexcept>
#include <vector>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "manager/evaluation.hpp"
#include "manager/harness.hpp"
#include "manager/source_validator.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace manager {

namespace {

class Stopwatch {
 public:
  Stopwatch() : start_(std::chrono::steady_clock::now()) {}
  int64_t Millis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start_)
        .count();
  }

 private:
  std::chrono::steady_clock::time_point start_;
};

executor::ExecutionRequest MakeRequest(const CompileResult& compiled,
                                       const std::string& workdir,
                                       const util::Canceller* canceller) {
  executor::ExecutionRequest request;
  request.binary = compiled.binary;
  request.workdir = workdir;
  request.timeout_millis = FLAGS_timeout_ms;
  request.max_output_bytes = FLAGS_max_output_bytes;
  request.canceller = canceller;
  return request;
}

// Describes an abnormal termination, or returns an empty string.
std::string RuntimeError(const executor::ExecutionOutcome& outcome) {
  if (outcome.cancelled) return "Execution cancelled";
  if (outcome.timed_out) {
    return absl::StrCat("Time limit exceeded (", FLAGS_timeout_ms, "ms)");
  }
  if (outcome.signal) {
    return absl::StrCat("Killed by signal ", *outcome.signal, " (",
                        strsignal(*outcome.signal), ")");
  }
  if (outcome.exit_code && *outcome.exit_code != 0) {
    return absl::StrCat("Exited with code ", *outcome.exit_code);
  }
  return "";
}

proto::Status FailureStatus(const executor::ExecutionOutcome& outcome) {
  if (outcome.cancelled) return proto::Status::CANCELLED;
  if (outcome.timed_out) return proto::Status::TIMEOUT;
  return proto::Status::RUNTIME_ERROR;
}

}  // namespace

proto::RunResponse Engine::Run(const proto::RunRequest& request,
                               const util::Canceller* canceller) {
  Stopwatch stopwatch;
  proto::RunResponse response;
  LOG(INFO) << "Run request, " << request.source_code().size() << " bytes";

  auto error = ValidateSource(request.source_code(), FLAGS_max_source_bytes);
  if (error) {
    response.set_status(proto::Status::VALIDATION_ERROR);
    response.set_validation_error(error->Message());
    response.set_execution_time_ms(stopwatch.Millis());
    return response;
  }

  util::TempDir workdir(FLAGS_temp_directory);
  CompileResult compiled =
      compiler_->Compile(request.source_code(), workdir.Path(), canceller);
  if (compiled.cancelled) {
    response.set_status(proto::Status::CANCELLED);
    response.set_runtime_error(compiled.diagnostics);
    response.set_execution_time_ms(stopwatch.Millis());
    return response;
  }
  if (!compiled.success) {
    response.set_status(proto::Status::COMPILE_ERROR);
    response.set_compile_error(compiled.diagnostics);
    if (request.has_criteria()) {
      response.set_criteria_met(
          EvaluateCriteria(request.criteria(), false, ""));
    }
    response.set_execution_time_ms(stopwatch.Millis());
    return response;
  }

  executor::ExecutionRequest exec_request =
      MakeRequest(compiled, workdir.Path(), canceller);
  if (request.has_stdin()) exec_request.stdin_data = request.stdin();
  executor::ExecutionOutcome outcome = executor_->Execute(exec_request);

  response.set_timed_out(outcome.timed_out);
  response.set_truncated(outcome.truncated);
  if (outcome.exit_code) response.set_exit_code(*outcome.exit_code);
  if (outcome.signal) response.set_signal(*outcome.signal);
  std::string runtime_error = RuntimeError(outcome);
  bool success = runtime_error.empty();
  if (!success) {
    response.set_runtime_error(runtime_error);
    response.set_status(FailureStatus(outcome));
  }
  if (request.has_criteria()) {
    bool met = EvaluateCriteria(request.criteria(), true, outcome.stdout_data);
    response.set_criteria_met(met);
    if (success && !met) response.set_status(proto::Status::WRONG_OUTPUT);
    success = success && met;
  }
  response.set_success(success);
  if (success) response.set_status(proto::Status::SUCCESS);
  response.set_stdout(std::move(outcome.stdout_data));
  response.set_stderr(std::move(outcome.stderr_data));
  response.set_execution_time_ms(stopwatch.Millis());
  LOG(INFO) << "Run finished: " << proto::Status_Name(response.status())
            << " in " << response.execution_time_ms() << "ms";
  return response;
}

proto::TestSuiteResult Engine::RunTests(const proto::HarnessRequest& request,
                                        const util::Canceller* canceller) {
  Stopwatch stopwatch;
  std::vector<proto::TestCase> test_cases;
  std::vector<int32_t> indices;
  for (int i = 0; i < request.test_cases_size(); i++) {
    if (request.samples_only() && !request.test_cases(i).sample()) continue;
    test_cases.push_back(request.test_cases(i));
    indices.push_back(i);
  }
  if (test_cases.empty()) {
    throw std::invalid_argument("No test cases selected");
  }
  LOG(INFO) << "Test request for " << request.signature().name() << ", "
            << test_cases.size() << " test cases";

  auto error = ValidateSource(request.source_code(), FLAGS_max_source_bytes);
  if (error) {
    proto::TestSuiteResult result;
    result.set_total(test_cases.size());
    result.set_status(proto::Status::VALIDATION_ERROR);
    result.set_validation_error(error->Message());
    result.set_execution_time_ms(stopwatch.Millis());
    return result;
  }

  std::string harness =
      GenerateHarness(request.source_code(), request.signature(), test_cases);

  util::TempDir workdir(FLAGS_temp_directory);
  CompileResult compiled =
      compiler_->Compile(harness, workdir.Path(), canceller);
  if (compiled.cancelled) {
    proto::TestSuiteResult result;
    result.set_total(test_cases.size());
    result.set_status(proto::Status::CANCELLED);
    result.set_runtime_error(compiled.diagnostics);
    result.set_execution_time_ms(stopwatch.Millis());
    return result;
  }
  if (!compiled.success) {
    proto::TestSuiteResult result =
        CompileFailure(test_cases.size(), compiled.diagnostics);
    result.set_execution_time_ms(stopwatch.Millis());
    return result;
  }

  executor::ExecutionOutcome outcome =
      executor_->Execute(MakeRequest(compiled, workdir.Path(), canceller));
  proto::TestSuiteResult result =
      EvaluateSuite(test_cases, indices, outcome.stdout_data);
  result.set_timed_out(outcome.timed_out);
  std::string runtime_error = RuntimeError(outcome);
  if (!runtime_error.empty()) {
    result.set_runtime_error(runtime_error);
    if (!result.passed()) result.set_status(FailureStatus(outcome));
  }
  result.set_execution_time_ms(stopwatch.Millis());
  LOG(INFO) << "Tests finished: " << result.passed_count() << "/"
            << result.total() << " in " << result.execution_time_ms() << "ms";
  return result;
}

}  // namespace manager
