#ifndef SANDBOX_BUBBLEWRAP_HPP
#define SANDBOX_BUBBLEWRAP_HPP

#include <string>
#include <vector>

#include "sandbox/unix.hpp"

namespace sandbox {

// Unix sandbox that runs the program through bubblewrap, in fresh network,
// PID and IPC namespaces, with a read-only view of the system directories and
// only the execution root writable.
class Bubblewrap : public Unix {
 public:
  static const constexpr Mode kMode = Mode::NAMESPACE_ISOLATION;
  static Sandbox* Create() { return new Bubblewrap(); }
  // Runs bwrap --unshare-pid -- /bin/true.
  static int Score();

 protected:
  Bubblewrap() = default;

  void WrapCommand(std::vector<std::string>* command) override;
  void OnFinish(ExecutionInfo* info) override;
};

}  // namespace sandbox

#endif
