#ifndef SANDBOX_SECCOMP_HPP
#define SANDBOX_SECCOMP_HPP

#include <cstdint>

#include "sandbox/seccomp_filter.hpp"
#include "sandbox/unix.hpp"

namespace sandbox {

// Unix sandbox that installs a syscall allow-list in the child just before
// exec. The program keeps its filesystem view but cannot spawn processes,
// open files for writing, signal other processes or touch the network.
class Seccomp : public Unix {
 public:
  static const constexpr Mode kMode = Mode::SECCOMP_FILTER;
  static Sandbox* Create() { return new Seccomp(); }
  // Installs the filter in a throwaway child.
  static int Score();

  // The policy applied to untrusted programs. exec_path is the address of
  // the only filename execve accepts.
  static SeccompFilter Policy(uint64_t exec_path);

 protected:
  Seccomp() = default;

  bool OnSetup(std::string* error_msg) override;
  bool OnChild(char* error_msg, size_t buflen) override;

 private:
  SeccompFilter filter_;
};

}  // namespace sandbox

#endif
