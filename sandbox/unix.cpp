#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadChunk = 64 * 1024;

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return std::string(prefix) + ": " + mystrerror(err, buf, kStrErrorBufSize);
}

// Reads everything currently available on a non-blocking descriptor. Bytes
// past limit (if positive) are dropped and reported through truncated.
// Returns false once the descriptor reached end of file.
bool ReadAvailable(int fd, int64_t limit, std::string* dest, bool* truncated) {
  char buf[kReadChunk];
  while (true) {
    ssize_t amount = read(fd, buf, kReadChunk);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    if (amount <= 0) return false;
    size_t keep = amount;
    if (limit > 0) {
      size_t room = dest->size() < static_cast<size_t>(limit)
                        ? static_cast<size_t>(limit) - dest->size()
                        : 0;
      if (keep > room) {
        keep = room;
        *truncated = true;
      }
    }
    dest->append(buf, keep);
  }
}

int RemainingMillis(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - std::chrono::steady_clock::now())
                  .count();
  if (left <= 0) return 0;
  return static_cast<int>(std::min<int64_t>(left + 1, INT_MAX));
}

void CloseFd(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}
}  // namespace

namespace sandbox {

int Unix::Score() { return FLAGS_allow_insecure_sandbox ? 1 : -1; }

Unix::~Unix() {
  KillAndReap();
  CloseFds();
}

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  std::string executable =
      util::File::JoinPath(options_->root, options_->executable);
  if (executable.empty() || executable[0] != '/') {
    char cwd[PATH_MAX] = {};
    if (getcwd(cwd, PATH_MAX) == nullptr) {
      *error_msg = ErrnoMessage("getcwd", errno);
      return false;
    }
    executable = util::File::JoinPath(cwd, executable);
  }

  // Everything the child touches is allocated here: the child of a
  // multithreaded parent may only perform async-signal-safe calls.
  command_.clear();
  command_.push_back(executable);
  command_.insert(command_.end(), options_->args.begin(), options_->args.end());
  WrapCommand(&command_);
  exec_path_ = command_[0];
  argv_.clear();
  for (std::string& arg : command_) argv_.push_back(&arg[0]);
  argv_.push_back(nullptr);
  env_ = options_->env;
  envp_.clear();
  for (std::string& var : env_) envp_.push_back(&var[0]);
  envp_.push_back(nullptr);

  // Children run with our uid: a dumpable parent would let them read
  // /proc/<ppid>/environ and friends.
  if (prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) == -1) {
    *error_msg = ErrnoMessage("prctl(PR_SET_DUMPABLE)", errno);
    return false;
  }

  // Close-on-exec, so that children forked concurrently by other threads do
  // not keep our pipes open.
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1 ||
      pipe2(stdout_fds_, O_CLOEXEC) == -1 ||
      pipe2(stderr_fds_, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  return OnSetup(error_msg);
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  pidfd_ = static_cast<int>(syscall(SYS_pidfd_open, child_pid_, 0));
  if (pidfd_ == -1) {
    *error_msg = ErrnoMessage("pidfd_open", errno);
    return false;
  }
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  close(stdout_fds_[0]);
  close(stderr_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) != sizeof(len)) _Exit(2);
    if (write(pipe_fds_[1], buf, len) != len) _Exit(2);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // New session and process group: the whole group is killed at the end.
  if (setsid() == -1) die("setsid", errno);

  // Do not leak the parent's signal setup into the program.
  sigset_t all_signals;
  sigemptyset(&all_signals);
  if (sigprocmask(SIG_SETMASK, &all_signals, nullptr) == -1)
    die("sigprocmask", errno);
  struct sigaction default_action = {};
  default_action.sa_handler = SIG_DFL;
  if (sigaction(SIGPIPE, &default_action, nullptr) == -1)
    die("sigaction", errno);

  const char* stdin_file = options_->stdin_file.empty()
                               ? "/dev/null"
                               : options_->stdin_file.c_str();
  int stdin_fd = open(stdin_file, O_RDONLY);
  if (stdin_fd == -1) die("open", errno);

  // Handle I/O redirection.
  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fds_[1], STDERR_FILENO) == -1) die("redir stderr", errno);
  if (stdin_fd != STDIN_FILENO) close(stdin_fd);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }
  int count = 0;
  do {
    execve(exec_path_.c_str(), argv_.data(), envp_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[1]);

  // The error pipe is closed by exec: anything written on it means the
  // program could not be started.
  int error_len = 0;
  ssize_t got = 0;
  do {
    got = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (got == -1 && errno == EINTR);
  if (got == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::max(0, std::min<int>(error_len, PIPE_BUF - 1));
    if (read(pipe_fds_[0], error, error_len) < 0) {
      *error_msg = ErrnoMessage("read", errno);
    } else {
      *error_msg = error;
    }
    KillAndReap();
    return false;
  }
  CloseFd(&pipe_fds_[0]);

  for (int fd : {stdout_fds_[0], stderr_fds_[0]}) {
    if (fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK) == -1) {
      *error_msg = ErrnoMessage("fcntl", errno);
      KillAndReap();
      return false;
    }
  }

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };
  auto deadline = program_start + std::chrono::milliseconds(
                                      options_->wall_limit_millis);
  const int64_t limit = options_->max_output_bytes;

  // Race between process exit, the wall clock deadline and cancellation.
  bool exited = false;
  while (!exited && !info->cancelled) {
    int timeout = -1;
    if (options_->wall_limit_millis > 0) {
      timeout = RemainingMillis(deadline);
      if (timeout == 0) {
        info->timed_out = true;
        break;
      }
    }
    struct pollfd fds[4] = {{stdout_fds_[0], POLLIN, 0},
                            {stderr_fds_[0], POLLIN, 0},
                            {pidfd_, POLLIN, 0},
                            {options_->cancel_fd, POLLIN, 0}};
    int ret = poll(fds, 4, timeout);
    if (ret == -1) {
      if (errno == EINTR) continue;
      *error_msg = ErrnoMessage("poll", errno);
      KillAndReap();
      return false;
    }
    if (fds[0].revents &&
        !ReadAvailable(stdout_fds_[0], limit, &info->stdout_data,
                       &info->stdout_truncated)) {
      CloseFd(&stdout_fds_[0]);
    }
    if (fds[1].revents &&
        !ReadAvailable(stderr_fds_[0], limit, &info->stderr_data,
                       &info->stderr_truncated)) {
      CloseFd(&stderr_fds_[0]);
    }
    if (fds[2].revents) exited = true;
    if (fds[3].revents) info->cancelled = true;
  }
  info->wall_time_millis = elapsed_millis();

  // Whatever happened, nothing started by the program may survive it. The
  // child is not reaped yet, so its process group id cannot be reused.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(ERROR) << "kill process group " << child_pid_;
  }

  // Collect what is still buffered in the pipes.
  auto drain_deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(options_->kill_grace_millis);
  while (stdout_fds_[0] != -1 || stderr_fds_[0] != -1) {
    int timeout = RemainingMillis(drain_deadline);
    if (timeout == 0) break;
    struct pollfd fds[2] = {{stdout_fds_[0], POLLIN, 0},
                            {stderr_fds_[0], POLLIN, 0}};
    int ret = poll(fds, 2, timeout);
    if (ret == -1 && errno == EINTR) continue;
    if (ret <= 0) break;
    if (fds[0].revents &&
        !ReadAvailable(stdout_fds_[0], limit, &info->stdout_data,
                       &info->stdout_truncated)) {
      CloseFd(&stdout_fds_[0]);
    }
    if (fds[1].revents &&
        !ReadAvailable(stderr_fds_[0], limit, &info->stderr_data,
                       &info->stderr_truncated)) {
      CloseFd(&stderr_fds_[0]);
    }
  }

  int child_status = 0;
  struct rusage rusage = {};
  int ret = 0;
  do {
    ret = wait4(child_pid_, &child_status, 0, &rusage);
  } while (ret == -1 && errno == EINTR);
  if (ret != child_pid_) {
    *error_msg = ErrnoMessage("wait4", errno);
    return false;
  }
  reaped_ = true;

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->memory_usage_kb = rusage.ru_maxrss;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;

  OnFinish(info);
  CloseFds();
  return true;
}

void Unix::KillAndReap() {
  if (child_pid_ <= 0 || reaped_) return;
  kill(-child_pid_, SIGKILL);
  // The child may not have called setsid yet.
  kill(child_pid_, SIGKILL);
  int status = 0;
  while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
  }
  reaped_ = true;
}

void Unix::CloseFds() {
  CloseFd(&pipe_fds_[0]);
  CloseFd(&pipe_fds_[1]);
  CloseFd(&stdout_fds_[0]);
  CloseFd(&stdout_fds_[1]);
  CloseFd(&stderr_fds_[0]);
  CloseFd(&stderr_fds_[1]);
  CloseFd(&pidfd_);
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
