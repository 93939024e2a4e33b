#include "sandbox/seccomp.hpp"

#include <fcntl.h>
#include <sched.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

#include "glog/logging.h"

namespace sandbox {

namespace {
const constexpr int kProbeScore = 3;

// What the C runtime, the dynamic loader and ordinary programs need.
const int kAllowedSyscalls[] = {
    // I/O on descriptors that are already open.
    __NR_read, __NR_write, __NR_readv, __NR_writev, __NR_pread64, __NR_close,
    __NR_lseek, __NR_dup, __NR_dup3, __NR_pipe2, __NR_fcntl, __NR_ioctl,
    __NR_ppoll, __NR_fstat, __NR_newfstatat, __NR_statx, __NR_readlinkat,
    __NR_faccessat, __NR_getcwd,
#ifdef __NR_faccessat2
    __NR_faccessat2,
#endif
#ifdef __NR_dup2
    __NR_dup2,
#endif
#ifdef __NR_pipe
    __NR_pipe,
#endif
#ifdef __NR_poll
    __NR_poll,
#endif
#ifdef __NR_stat
    __NR_stat, __NR_lstat,
#endif
#ifdef __NR_access
    __NR_access,
#endif
#ifdef __NR_readlink
    __NR_readlink,
#endif
    // Memory.
    __NR_brk, __NR_mmap, __NR_munmap, __NR_mprotect, __NR_mremap, __NR_msync,
    __NR_madvise,
    // Threads.
    __NR_futex, __NR_set_robust_list, __NR_set_tid_address, __NR_gettid,
    __NR_sched_yield,
#ifdef __NR_rseq
    __NR_rseq,
#endif
    // Time.
    __NR_nanosleep, __NR_clock_nanosleep, __NR_clock_gettime,
    __NR_clock_getres, __NR_gettimeofday, __NR_times, __NR_getrusage,
#ifdef __NR_time
    __NR_time,
#endif
    // Identity.
    __NR_getpid, __NR_getppid, __NR_getuid, __NR_geteuid, __NR_getgid,
    __NR_getegid,
    // Signals.
    __NR_rt_sigaction, __NR_rt_sigprocmask, __NR_rt_sigreturn,
    __NR_sigaltstack,
    // Process.
    __NR_exit, __NR_exit_group, __NR_uname, __NR_getrlimit, __NR_getrandom,
    __NR_prctl,
#ifdef __NR_arch_prctl
    __NR_arch_prctl,
#endif
};

// Syscalls taking a target pid as their first argument. Only pid 0, the
// caller itself, is accepted.
const int kSelfOnlySyscalls[] = {
    __NR_prlimit64,
    __NR_get_robust_list,
    __NR_sched_getaffinity,
};

// Flags that would let open modify the filesystem.
const constexpr uint32_t kWriteOpenFlags =
    O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND;
}  // namespace

SeccompFilter Seccomp::Policy(uint64_t exec_path) {
  SeccompFilter filter;
  for (int nr : kAllowedSyscalls) filter.Allow(nr);
  for (int nr : kSelfOnlySyscalls) {
    filter.AllowIfArgEquals(nr, 0, 0, SeccompFilter::Errno(EPERM));
  }

  // Only threads: fork and vfork go through clone without CLONE_THREAD.
  filter.AllowIfArgHasBits(__NR_clone, 0, CLONE_THREAD, SeccompFilter::kKill);
#ifdef __NR_clone3
  // The flags of clone3 live in memory, out of reach of the filter. The C
  // library falls back to clone on ENOSYS.
  filter.Fail(__NR_clone3, ENOSYS);
#endif

  filter.AllowIfArgLacksBits(__NR_openat, 2, kWriteOpenFlags,
                             SeccompFilter::Errno(EACCES));
#ifdef __NR_open
  filter.AllowIfArgLacksBits(__NR_open, 1, kWriteOpenFlags,
                             SeccompFilter::Errno(EACCES));
#endif

  // The exec of the untrusted program itself, and nothing else.
  filter.AllowIfArgEquals(__NR_execve, 0, exec_path, SeccompFilter::kKill);

  // abort() signals its own thread group.
  filter.AllowIfArgIsOwnPid(__NR_tgkill, 0, SeccompFilter::kKill);
#ifdef __NR_tkill
  filter.AllowIfArgIsOwnPid(__NR_tkill, 0, SeccompFilter::kKill);
#endif

  filter.Finish();
  return filter;
}

int Seccomp::Score() {
  SeccompFilter filter = Policy(0);
  pid_t pid = fork();
  if (pid == -1) {
    PLOG(WARNING) << "seccomp probe: fork";
    return -1;
  }
  if (pid == 0) {
    char buf[256] = {};
    filter.BindPid(getpid());
    if (!filter.Install(buf, sizeof(buf))) _exit(1);
    _exit(0);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      PLOG(WARNING) << "seccomp probe: waitpid";
      return -1;
    }
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return kProbeScore;
  LOG(WARNING) << "seccomp filters cannot be installed on this system";
  return -1;
}

bool Seccomp::OnSetup(std::string* /*error_msg*/) {
  filter_ = Policy(reinterpret_cast<uintptr_t>(ExecPath()));
  return true;
}

bool Seccomp::OnChild(char* error_msg, size_t buflen) {
  filter_.BindPid(getpid());
  return filter_.Install(error_msg, buflen);
}

namespace {
Sandbox::Register<Seccomp> r;
}  // namespace

}  // namespace sandbox
