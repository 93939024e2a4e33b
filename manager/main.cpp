#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "absl/types/optional.h"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/engine.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(request, "-", "JSON request to serve, or - for stdin");  // NOLINT
DEFINE_string(kind, "run",                                              // NOLINT
              "Request type: run (free-form program) or tests (function "
              "against test cases)");
DEFINE_bool(probe, false, "Only print the sandbox mode and exit");  // NOLINT

namespace {

std::string ReadRequest() {
  if (FLAGS_request == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::Read(FLAGS_request);
}

absl::optional<sandbox::Mode> ResolveSandbox() {
  try {
    return sandbox::Sandbox::Resolve();
  } catch (const sandbox::sandbox_unavailable& e) {
    LOG(ERROR) << e.what();
    return absl::nullopt;
  }
}

template <typename Message>
Message ParseRequest(const std::string& json) {
  Message message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status =
      google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw std::invalid_argument("Invalid request: " + status.ToString());
  }
  return message;
}

template <typename Message>
std::string ToJson(const Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  CHECK(status.ok()) << status.ToString();
  return json;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Compiles and runs untrusted C code in a sandbox");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  absl::optional<sandbox::Mode> mode = ResolveSandbox();
  CHECK(mode) << "Refusing to run untrusted code without a sandbox";
  if (FLAGS_probe) {
    std::cout << sandbox::ModeName(*mode) << std::endl;
    return 0;
  }

  try {
    manager::CCompiler compiler;
    executor::LocalExecutor executor(*mode);
    manager::Engine engine(&compiler, &executor);
    std::string json = ReadRequest();
    if (FLAGS_kind == "run") {
      std::cout << ToJson(engine.Run(ParseRequest<proto::RunRequest>(json)))
                << std::endl;
    } else if (FLAGS_kind == "tests") {
      std::cout << ToJson(engine.RunTests(
                       ParseRequest<proto::HarnessRequest>(json)))
                << std::endl;
    } else {
      LOG(ERROR) << "Unknown request kind: " << FLAGS_kind;
      return 2;
    }
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << e.what();
    return 2;
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
  return 0;
}
