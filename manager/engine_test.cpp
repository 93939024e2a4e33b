#include "manager/engine.hpp"

#include <sys/stat.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/canceller.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::StartsWith;

using namespace manager;

class MockCompiler : public Compiler {
 public:
  MOCK_METHOD(CompileResult, Compile,
              (const std::string& source, const std::string& workdir,
               const util::Canceller* canceller),
              (override));
};

class MockExecutor : public executor::Executor {
 public:
  MOCK_METHOD(executor::ExecutionOutcome, Execute,
              (const executor::ExecutionRequest& request), (override));
};

CompileResult Compiled() {
  CompileResult result;
  result.success = true;
  result.binary = "/nonexistent/main";
  return result;
}

CompileResult NotCompiled(const std::string& diagnostics) {
  CompileResult result;
  result.diagnostics = diagnostics;
  return result;
}

CompileResult CompileCancelled() {
  CompileResult result;
  result.cancelled = true;
  result.diagnostics = "Compilation cancelled";
  return result;
}

executor::ExecutionOutcome Exited(int code, const std::string& out) {
  executor::ExecutionOutcome outcome;
  outcome.exit_code = code;
  outcome.stdout_data = out;
  return outcome;
}

executor::ExecutionOutcome TimedOut() {
  executor::ExecutionOutcome outcome;
  outcome.timed_out = true;
  return outcome;
}

class EngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FLAGS_temp_directory = ::testing::TempDir() + "cwarden_engine_test";
  }

  gflags::FlagSaver saver_;
  MockCompiler compiler_;
  MockExecutor executor_;
  Engine engine_{&compiler_, &executor_};
};

proto::HarnessRequest AddRequest(int num_cases) {
  proto::HarnessRequest request;
  request.set_source_code("int add(int a, int b) { return a + b; }");
  request.mutable_signature()->set_name("add");
  request.mutable_signature()->set_return_type("int");
  for (const char* name : {"a", "b"}) {
    proto::FunctionParameter* param =
        request.mutable_signature()->add_parameters();
    param->set_name(name);
    param->set_type("int");
  }
  for (int i = 0; i < num_cases; i++) {
    proto::TestCase* test_case = request.add_test_cases();
    test_case->add_input()->set_number_value(i);
    test_case->add_input()->set_number_value(1);
    test_case->set_expected(std::to_string(i + 1));
    test_case->set_sample(i == 0);
  }
  return request;
}

TEST_F(EngineTest, TestTooLargeSkipsCompiler) {
  FLAGS_max_source_bytes = 10;
  EXPECT_CALL(compiler_, Compile(_, _, _)).Times(0);
  EXPECT_CALL(executor_, Execute(_)).Times(0);
  proto::RunRequest request;
  request.set_source_code("int main() { return 0; }");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.status(), proto::Status::VALIDATION_ERROR);
  EXPECT_THAT(response.validation_error(), HasSubstr("too large"));
}

TEST_F(EngineTest, TestDangerousCallSkipsCompiler) {
  EXPECT_CALL(compiler_, Compile(_, _, _)).Times(0);
  EXPECT_CALL(executor_, Execute(_)).Times(0);
  proto::RunRequest request;
  request.set_source_code("int main() { system(\"ls\"); }");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_EQ(response.status(), proto::Status::VALIDATION_ERROR);
  EXPECT_THAT(response.validation_error(), HasSubstr("system("));
}

TEST_F(EngineTest, TestCompileErrorSkipsExecution) {
  EXPECT_CALL(compiler_, Compile(_, _, _))
      .WillOnce(Return(NotCompiled("main.c:1: error: expected ';'")));
  EXPECT_CALL(executor_, Execute(_)).Times(0);
  proto::RunRequest request;
  request.set_source_code("int main() { return 0 }");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.status(), proto::Status::COMPILE_ERROR);
  EXPECT_EQ(response.compile_error(), "main.c:1: error: expected ';'");
  EXPECT_FALSE(response.has_exit_code());
}

TEST_F(EngineTest, TestSuccessfulRun) {
  EXPECT_CALL(compiler_, Compile("int main() {}", _, _))
      .WillOnce(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_))
      .WillOnce(Invoke([](const executor::ExecutionRequest& request) {
        EXPECT_EQ(request.binary, "/nonexistent/main");
        EXPECT_EQ(*request.stdin_data, "input");
        EXPECT_EQ(request.timeout_millis, FLAGS_timeout_ms);
        return Exited(0, "Hello\n");
      }));
  proto::RunRequest request;
  request.set_source_code("int main() {}");
  request.set_stdin("input");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_TRUE(response.success());
  EXPECT_EQ(response.status(), proto::Status::SUCCESS);
  EXPECT_EQ(response.stdout(), "Hello\n");
  ASSERT_TRUE(response.has_exit_code());
  EXPECT_EQ(response.exit_code(), 0);
  EXPECT_FALSE(response.has_compile_error());
  EXPECT_FALSE(response.has_criteria_met());
}

TEST_F(EngineTest, TestNonzeroExit) {
  EXPECT_CALL(compiler_, Compile(_, _, _)).WillOnce(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_)).WillOnce(Return(Exited(3, "")));
  proto::RunRequest request;
  request.set_source_code("int main() { return 3; }");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.status(), proto::Status::RUNTIME_ERROR);
  EXPECT_EQ(response.exit_code(), 3);
  EXPECT_EQ(response.runtime_error(), "Exited with code 3");
}

TEST_F(EngineTest, TestSignal) {
  executor::ExecutionOutcome outcome;
  outcome.signal = 11;
  EXPECT_CALL(compiler_, Compile(_, _, _)).WillOnce(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_)).WillOnce(Return(outcome));
  proto::RunRequest request;
  request.set_source_code("int main() { *(int*)0 = 1; }");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.signal(), 11);
  EXPECT_FALSE(response.has_exit_code());
  EXPECT_THAT(response.runtime_error(), StartsWith("Killed by signal 11"));
}

TEST_F(EngineTest, TestTimeout) {
  EXPECT_CALL(compiler_, Compile(_, _, _)).WillOnce(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_)).WillOnce(Return(TimedOut()));
  proto::RunRequest request;
  request.set_source_code("int main() { while (1) {} }");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_FALSE(response.success());
  EXPECT_TRUE(response.timed_out());
  EXPECT_FALSE(response.has_exit_code());
  EXPECT_EQ(response.status(), proto::Status::TIMEOUT);
}

TEST_F(EngineTest, TestCriteria) {
  EXPECT_CALL(compiler_, Compile(_, _, _))
      .Times(2)
      .WillRepeatedly(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_))
      .Times(2)
      .WillRepeatedly(Return(Exited(0, "Hello, World!\n")));
  proto::RunRequest request;
  request.set_source_code("int main() {}");
  request.mutable_criteria()->mutable_exact_match()->set_expected_stdout(
      "Hello, World!");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_TRUE(response.success());
  EXPECT_TRUE(response.criteria_met());

  request.mutable_criteria()->mutable_exact_match()->set_expected_stdout("Bye");
  response = engine_.Run(request);
  EXPECT_FALSE(response.success());
  EXPECT_FALSE(response.criteria_met());
  EXPECT_EQ(response.status(), proto::Status::WRONG_OUTPUT);
}

TEST_F(EngineTest, TestRunTestsAllPass) {
  EXPECT_CALL(compiler_, Compile(HasSubstr("int main(void)"), _, _))
      .WillOnce(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_))
      .WillOnce(Return(Exited(0, "1\n\x1e\n2\n\x1e\n3\n\x1e\n")));
  proto::TestSuiteResult result = engine_.RunTests(AddRequest(3));
  EXPECT_TRUE(result.passed());
  EXPECT_EQ(result.total(), 3);
  EXPECT_EQ(result.passed_count(), 3);
  EXPECT_FALSE(result.has_compilation_error());
}

TEST_F(EngineTest, TestRunTestsCompileError) {
  EXPECT_CALL(compiler_, Compile(_, _, _))
      .WillOnce(Return(NotCompiled("error: expected ';'")));
  EXPECT_CALL(executor_, Execute(_)).Times(0);
  proto::TestSuiteResult result = engine_.RunTests(AddRequest(2));
  EXPECT_FALSE(result.passed());
  EXPECT_EQ(result.passed_count(), 0);
  EXPECT_EQ(result.compilation_error(), "error: expected ';'");
}

TEST_F(EngineTest, TestRunTestsCrashKeepsEarlierRecords) {
  executor::ExecutionOutcome outcome;
  outcome.signal = 11;
  outcome.stdout_data = "1\n\x1e\n";
  EXPECT_CALL(compiler_, Compile(_, _, _)).WillOnce(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_)).WillOnce(Return(outcome));
  proto::TestSuiteResult result = engine_.RunTests(AddRequest(3));
  EXPECT_FALSE(result.passed());
  EXPECT_EQ(result.passed_count(), 1);
  EXPECT_EQ(result.status(), proto::Status::RUNTIME_ERROR);
  EXPECT_THAT(result.runtime_error(), StartsWith("Killed by signal 11"));
}

TEST_F(EngineTest, TestRunTestsSamplesOnly) {
  EXPECT_CALL(compiler_, Compile(_, _, _)).WillOnce(Return(Compiled()));
  EXPECT_CALL(executor_, Execute(_)).WillOnce(Return(Exited(0, "1\n\x1e\n")));
  proto::HarnessRequest request = AddRequest(3);
  request.set_samples_only(true);
  proto::TestSuiteResult result = engine_.RunTests(request);
  EXPECT_TRUE(result.passed());
  EXPECT_EQ(result.total(), 1);
}

TEST_F(EngineTest, TestRunTestsContentErrors) {
  EXPECT_CALL(compiler_, Compile(_, _, _)).Times(0);
  proto::HarnessRequest request = AddRequest(1);
  request.mutable_test_cases(0)->mutable_input(0)->set_string_value("x");
  EXPECT_THROW(engine_.RunTests(request), std::invalid_argument);
  EXPECT_THROW(engine_.RunTests(AddRequest(0)), std::invalid_argument);
}

TEST_F(EngineTest, TestRunTestsValidatesLearnerCode) {
  EXPECT_CALL(compiler_, Compile(_, _, _)).Times(0);
  proto::HarnessRequest request = AddRequest(1);
  request.set_source_code("int add(int a, int b) { return fork(); }");
  proto::TestSuiteResult result = engine_.RunTests(request);
  EXPECT_FALSE(result.passed());
  EXPECT_EQ(result.status(), proto::Status::VALIDATION_ERROR);
}

TEST_F(EngineTest, TestCancelledCompileSkipsExecution) {
  EXPECT_CALL(compiler_, Compile(_, _, _))
      .WillOnce(Return(CompileCancelled()));
  EXPECT_CALL(executor_, Execute(_)).Times(0);
  proto::RunRequest request;
  request.set_source_code("int main() { return 0; }");
  proto::RunResponse response = engine_.Run(request);
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.status(), proto::Status::CANCELLED);
  EXPECT_FALSE(response.has_compile_error());

  EXPECT_CALL(compiler_, Compile(_, _, _))
      .WillOnce(Return(CompileCancelled()));
  proto::TestSuiteResult result = engine_.RunTests(AddRequest(2));
  EXPECT_FALSE(result.passed());
  EXPECT_EQ(result.total(), 2);
  EXPECT_EQ(result.status(), proto::Status::CANCELLED);
}

// Drives the real compiler wrapper with a compiler that never finishes.
class SlowCompilerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FLAGS_temp_directory = ::testing::TempDir() + "cwarden_engine_test";
    script_dir_.reset(new util::TempDir(FLAGS_temp_directory));
    std::string script = script_dir_->Path() + "/slow_cc";
    util::File::Write(script, "#!/bin/sh\nexec sleep 30\n");
    ASSERT_EQ(chmod(script.c_str(), 0755), 0);
    FLAGS_compiler = script;
    compiler_.reset(new CCompiler());
    engine_.reset(new Engine(compiler_.get(), &executor_));
  }

  proto::RunRequest Request() {
    proto::RunRequest request;
    request.set_source_code("int main() { return 0; }");
    return request;
  }

  gflags::FlagSaver saver_;
  std::unique_ptr<util::TempDir> script_dir_;
  std::unique_ptr<CCompiler> compiler_;
  MockExecutor executor_;
  std::unique_ptr<Engine> engine_;
};

TEST_F(SlowCompilerTest, TestCompileTimeoutIsCompileError) {
  FLAGS_compile_timeout_ms = 300;
  EXPECT_CALL(executor_, Execute(_)).Times(0);
  proto::RunResponse response = engine_->Run(Request());
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.status(), proto::Status::COMPILE_ERROR);
  EXPECT_THAT(response.compile_error(), HasSubstr("timed out"));
  EXPECT_LT(response.execution_time_ms(), 10000);
}

TEST_F(SlowCompilerTest, TestCancelDuringCompile) {
  FLAGS_compile_timeout_ms = 60000;
  EXPECT_CALL(executor_, Execute(_)).Times(0);
  util::Canceller canceller;
  std::thread cancel([&canceller]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    canceller.Cancel();
  });
  proto::RunResponse response = engine_->Run(Request(), &canceller);
  cancel.join();
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.status(), proto::Status::CANCELLED);
  EXPECT_LT(response.execution_time_ms(), 10000);
}

}  // namespace
