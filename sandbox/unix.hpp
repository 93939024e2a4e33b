#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. Used on its own it only
// applies resource limits: this is the insecure fallback, and it is also how
// the trusted compiler runs.
class Unix : public Sandbox {
 public:
  static const constexpr Mode kMode = Mode::INSECURE_FALLBACK;
  static Sandbox* Create() { return new Unix(); }
  // Usable only when the operator explicitly allowed it.
  static int Score();

  ~Unix() override;

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Hook that is executed at the end of Setup, in the parent. Everything the
  // child needs has to be allocated here.
  virtual bool OnSetup(std::string* /*error_msg*/) { return true; }

  // Rewrites the command line that will be executed. command[0] is the path
  // passed to execve.
  virtual void WrapCommand(std::vector<std::string>* /*command*/) {}

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed just before exec. Returns false if something went
  // wrong and exec should not be called. The error_msg string must not be
  // longer then buflen characters. This function must not use dynamic memory
  // allocation.
  virtual bool OnChild(char* /*error_msg*/, size_t /*buflen*/) { return true; }

  // Waits for the termination of the child, or for the wall time limit, or for
  // cancellation, whichever comes first, collecting its output in the
  // meantime. The whole process group is killed before returning.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Executed when the child program exits. May change the execution info with
  // "better" values, or perform clean up.
  virtual void OnFinish(ExecutionInfo* /*info*/) {}

  // Path that the child passes to execve. The pointer stays valid, and keeps
  // its value in the child, from the end of Setup until the execution ends.
  const char* ExecPath() const { return exec_path_.c_str(); }

  const ExecutionOptions* options_ = nullptr;

 private:
  // Kills the process group and reaps the child, if still needed.
  void KillAndReap();
  void CloseFds();

  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  int pidfd_ = -1;
  int child_pid_ = 0;
  bool reaped_ = false;

  std::string exec_path_;
  std::vector<std::string> command_;
  std::vector<char*> argv_;
  std::vector<std::string> env_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif
