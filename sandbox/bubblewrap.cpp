#include "sandbox/bubblewrap.hpp"

#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <memory>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace sandbox {

namespace {
const constexpr int kProbeScore = 2;
const constexpr int kProbeTimeoutMillis = 5000;
// bwrap reports a child killed by signal n as exit status 128 + n.
const constexpr int kSignalExitBase = 128;

std::string Absolute(const std::string& path) {
  if (!path.empty() && path[0] == '/') return path;
  char cwd[PATH_MAX] = {};
  if (getcwd(cwd, PATH_MAX) == nullptr) return path;
  return util::File::JoinPath(cwd, path);
}
}  // namespace

int Bubblewrap::Score() {
  if (util::which(FLAGS_bwrap).empty()) {
    VLOG(1) << FLAGS_bwrap << " not found in PATH";
    return -1;
  }
  util::TempDir root(FLAGS_temp_directory);
  std::unique_ptr<Sandbox> sandbox(Create());
  ExecutionOptions options(root.Path(), "/bin/true");
  options.wall_limit_millis = kProbeTimeoutMillis;
  ExecutionInfo info;
  std::string error_msg;
  if (!sandbox->Execute(options, &info, &error_msg)) {
    LOG(WARNING) << "bubblewrap probe: " << error_msg;
    return -1;
  }
  if (info.timed_out || info.status_code != 0 || info.signal != 0) {
    LOG(WARNING) << "bubblewrap probe failed: " << info.stderr_data;
    return -1;
  }
  return kProbeScore;
}

void Bubblewrap::WrapCommand(std::vector<std::string>* command) {
  std::string bwrap = util::which(FLAGS_bwrap);
  if (bwrap.empty()) bwrap = FLAGS_bwrap;
  std::string root = Absolute(options_->root);
  std::vector<std::string> wrapped = {
      bwrap,           "--unshare-net", "--unshare-pid", "--unshare-ipc",
      "--die-with-parent",
      "--ro-bind",     "/usr",          "/usr",
      "--ro-bind",     "/lib",          "/lib",
      "--ro-bind",     "/bin",          "/bin",
      "--ro-bind-try", "/lib64",        "/lib64",
      "--ro-bind",     "/etc",          "/etc",
      "--tmpfs",       "/tmp",
      "--bind",        root,            root,
      "--chdir",       root,
      "--dev",         "/dev",
      "--proc",        "/proc",
      "--"};
  wrapped.insert(wrapped.end(), command->begin(), command->end());
  command->swap(wrapped);
}

void Bubblewrap::OnFinish(ExecutionInfo* info) {
  if (info->signal == 0 && info->status_code > kSignalExitBase) {
    info->signal = info->status_code - kSignalExitBase;
    info->status_code = 0;
  }
}

namespace {
Sandbox::Register<Bubblewrap> r;
}  // namespace

}  // namespace sandbox
