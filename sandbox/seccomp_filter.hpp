#ifndef SANDBOX_SECCOMP_FILTER_HPP
#define SANDBOX_SECCOMP_FILTER_HPP

#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sandbox {

// Builder for a classic BPF seccomp program. Rules are checked in the order
// they are added; a syscall that matches no rule kills the process.
//
// The program is built in the parent. BindPid and Install only touch memory
// allocated beforehand, so they can be called in a child forked from a
// multithreaded process.
class SeccompFilter {
 public:
  static uint32_t Errno(int err) {
    return SECCOMP_RET_ERRNO | (static_cast<uint32_t>(err) & SECCOMP_RET_DATA);
  }
  static const constexpr uint32_t kKill = SECCOMP_RET_KILL_PROCESS;
  static const constexpr uint32_t kAllow = SECCOMP_RET_ALLOW;

  SeccompFilter();

  // Unconditionally allows nr.
  void Allow(int nr);

  // Makes nr fail with err without running it.
  void Fail(int nr, int err);

  // Allows nr if its argument arg equals value, otherwise takes action
  // otherwise.
  void AllowIfArgEquals(int nr, int arg, uint64_t value, uint32_t otherwise);

  // Allows nr if any of bits is set in the low 32 bits of argument arg.
  void AllowIfArgHasBits(int nr, int arg, uint32_t bits, uint32_t otherwise);

  // Allows nr if none of bits is set in the low 32 bits of argument arg.
  void AllowIfArgLacksBits(int nr, int arg, uint32_t bits, uint32_t otherwise);

  // Allows nr if argument arg is the pid given to BindPid.
  void AllowIfArgIsOwnPid(int nr, int arg, uint32_t otherwise);

  // Appends the default action. No rule can be added afterwards.
  void Finish();

  // Patches every AllowIfArgIsOwnPid rule with pid. Async-signal-safe.
  void BindPid(pid_t pid);

  // Sets no-new-privs and installs the program in the calling thread. On
  // failure writes at most buflen bytes to error_msg and returns false.
  // Async-signal-safe.
  bool Install(char* error_msg, size_t buflen) const;

  const std::vector<sock_filter>& Program() const { return program_; }

 private:
  void LoadArg(int arg, bool high);

  std::vector<sock_filter> program_;
  std::vector<size_t> pid_slots_;
  bool finished_ = false;
};

}  // namespace sandbox

#endif
