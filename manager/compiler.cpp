#include "manager/compiler.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace manager {

namespace {
const constexpr int64_t kMaxDiagnosticsBytes = 64 * 1024;
const char kSourceName[] = "main.c";
const char kBinaryName[] = "main";
}  // namespace

CCompiler::CCompiler() : compiler_(util::which(FLAGS_compiler)) {
  if (compiler_.empty()) {
    throw std::domain_error("C compiler not found: " + FLAGS_compiler);
  }
}

CompileResult CCompiler::Compile(const std::string& source,
                                 const std::string& workdir,
                                 const util::Canceller* canceller) {
  util::File::Write(util::File::JoinPath(workdir, kSourceName), source);

  // The compiler is trusted: it only gets the resource limits.
  sandbox::ExecutionOptions options(workdir, compiler_);
  options.args = {"-std=c11", "-O2",       "-Wall",     "-o", kBinaryName,
                  kSourceName, "-lm", "-lpthread"};
  const char* path = getenv("PATH");
  if (path != nullptr) options.env.push_back(absl::StrCat("PATH=", path));
  options.wall_limit_millis = FLAGS_compile_timeout_ms;
  options.max_output_bytes = kMaxDiagnosticsBytes;
  options.kill_grace_millis = FLAGS_kill_grace_ms;
  if (canceller != nullptr) options.cancel_fd = canceller->Fd();

  sandbox::ExecutionInfo info;
  std::string error_msg;
  std::unique_ptr<sandbox::Sandbox> sb =
      sandbox::Sandbox::Create(sandbox::Mode::INSECURE_FALLBACK);
  if (!sb->Execute(options, &info, &error_msg)) {
    throw std::runtime_error("Cannot run the compiler: " + error_msg);
  }

  CompileResult result;
  if (info.cancelled) {
    result.cancelled = true;
    result.diagnostics = "Compilation cancelled";
    return result;
  }
  if (info.timed_out) {
    result.diagnostics = absl::StrCat("Compilation timed out after ",
                                      FLAGS_compile_timeout_ms, "ms");
    return result;
  }
  result.diagnostics = info.stderr_data + info.stdout_data;
  if (info.signal != 0 || info.status_code != 0) {
    VLOG(1) << "Compilation failed with status " << info.status_code
            << ", signal " << info.signal;
    if (result.diagnostics.empty()) {
      result.diagnostics = absl::StrCat("Compiler exited with status ",
                                        info.status_code, ", signal ",
                                        info.signal);
    }
    return result;
  }
  result.success = true;
  result.binary = util::File::JoinPath(workdir, kBinaryName);
  return result;
}

}  // namespace manager
