#include "sandbox/seccomp_filter.hpp"

#include <linux/audit.h>
#include <sys/prctl.h>

#include <cerrno>
#include <cstring>

#include "glog/logging.h"

#if defined(__x86_64__)
#define CWARDEN_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
#define CWARDEN_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
#error "seccomp filtering is not supported on this architecture"
#endif

namespace sandbox {

namespace {
// x32 syscalls share the x86_64 audit arch and are told apart by this bit.
const constexpr uint32_t kX32SyscallBit = 0x40000000;

uint32_t ArgOffset(int arg, bool high) {
  // Arguments are stored little-endian: the high word follows the low one.
  return offsetof(struct seccomp_data, args) + arg * sizeof(uint64_t) +
         (high ? sizeof(uint32_t) : 0);
}

void CopyError(char* error_msg, size_t buflen, const char* prefix, int err) {
  if (buflen == 0) return;
  error_msg[0] = 0;
  strncat(error_msg, prefix, buflen - 1);
  size_t used = strlen(error_msg);
  if (used + 2 >= buflen) return;
  strncat(error_msg, ": ", buflen - used - 1);
  used += 2;
  char buf[256] = {};
#ifdef _GNU_SOURCE
  const char* msg = strerror_r(err, buf, sizeof(buf));
#else
  strerror_r(err, buf, sizeof(buf));
  const char* msg = buf;
#endif
  strncat(error_msg, msg, buflen - used - 1);
}
}  // namespace

SeccompFilter::SeccompFilter() {
  program_ = {
      BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)),
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, CWARDEN_AUDIT_ARCH, 1, 0),
      BPF_STMT(BPF_RET | BPF_K, kKill),
      BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)),
  };
#if defined(__x86_64__)
  program_.push_back(
      BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, kX32SyscallBit, 0, 1));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, kKill));
#endif
}

void SeccompFilter::LoadArg(int arg, bool high) {
  CHECK(arg >= 0 && arg < 6) << "Invalid syscall argument " << arg;
  program_.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, ArgOffset(arg, high)));
}

// Every rule starts with a jump over its own body when nr does not match, and
// every path through the body returns, so the accumulator still holds nr at
// the start of the next rule.

void SeccompFilter::Allow(int nr) {
  CHECK(!finished_);
  program_.push_back(
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, kAllow));
}

void SeccompFilter::Fail(int nr, int err) {
  CHECK(!finished_);
  program_.push_back(
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, Errno(err)));
}

void SeccompFilter::AllowIfArgEquals(int nr, int arg, uint64_t value,
                                     uint32_t otherwise) {
  CHECK(!finished_);
  program_.push_back(
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 6));
  LoadArg(arg, false);
  program_.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K,
                              static_cast<uint32_t>(value), 0, 2));
  LoadArg(arg, true);
  program_.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K,
                              static_cast<uint32_t>(value >> 32), 1, 0));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, otherwise));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, kAllow));
}

void SeccompFilter::AllowIfArgHasBits(int nr, int arg, uint32_t bits,
                                      uint32_t otherwise) {
  CHECK(!finished_);
  program_.push_back(
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 4));
  LoadArg(arg, false);
  program_.push_back(BPF_JUMP(BPF_JMP | BPF_JSET | BPF_K, bits, 1, 0));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, otherwise));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, kAllow));
}

void SeccompFilter::AllowIfArgLacksBits(int nr, int arg, uint32_t bits,
                                        uint32_t otherwise) {
  CHECK(!finished_);
  program_.push_back(
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 4));
  LoadArg(arg, false);
  program_.push_back(BPF_JUMP(BPF_JMP | BPF_JSET | BPF_K, bits, 0, 1));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, otherwise));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, kAllow));
}

void SeccompFilter::AllowIfArgIsOwnPid(int nr, int arg, uint32_t otherwise) {
  CHECK(!finished_);
  program_.push_back(
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 4));
  LoadArg(arg, false);
  // Compares against pid 0 (never a valid target) until BindPid runs.
  pid_slots_.push_back(program_.size());
  program_.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, 0, 1, 0));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, otherwise));
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, kAllow));
}

void SeccompFilter::Finish() {
  CHECK(!finished_);
  program_.push_back(BPF_STMT(BPF_RET | BPF_K, kKill));
  finished_ = true;
}

void SeccompFilter::BindPid(pid_t pid) {
  for (size_t slot : pid_slots_) program_[slot].k = static_cast<uint32_t>(pid);
}

bool SeccompFilter::Install(char* error_msg, size_t buflen) const {
  if (!finished_) {
    CopyError(error_msg, buflen, "seccomp: filter not finished", EINVAL);
    return false;
  }
  struct sock_fprog prog = {};
  prog.len = static_cast<unsigned short>(program_.size());
  prog.filter = const_cast<sock_filter*>(program_.data());
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    CopyError(error_msg, buflen, "prctl(NO_NEW_PRIVS)", errno);
    return false;
  }
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == -1) {
    CopyError(error_msg, buflen, "prctl(SECCOMP)", errno);
    return false;
  }
  return true;
}

}  // namespace sandbox
