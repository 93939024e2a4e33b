#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// Isolation mechanisms, from the strongest to the weakest.
enum class Mode { SECCOMP_FILTER, NAMESPACE_ISOLATION, INSECURE_FALLBACK };

const char* ModeName(Mode mode);

// Thrown when no sandbox can be used. This is a startup condition: the caller
// must refuse to run untrusted code at all.
class sandbox_unavailable : public std::runtime_error {
 public:
  explicit sandbox_unavailable(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  // Bytes kept from each of stdout and stderr; 0 means unlimited.
  int64_t max_output_bytes = 0;
  // Time allowed for the output pipes to drain once the process group has
  // been killed.
  int64_t kill_grace_millis = 500;
  // When this descriptor becomes readable the execution is cancelled.
  int cancel_fd = -1;

  std::string stdin_file = "";
  std::vector<std::string> args;
  // Environment of the child, as NAME=value strings. Empty by default.
  std::vector<std::string> env;

  // Required values. A relative executable is relative to root.
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The process group was killed because the wall limit expired or the
  // execution was cancelled. status_code and signal then only describe the
  // forced kill.
  bool timed_out = false;
  bool cancelled = false;

  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create and Score static functions and a kMode constant. Create should return
// a pointer to a newly allocated instance of the given implementation, while
// Score should return a value that defines how "good" that sandbox is:
// negative if the sandbox should not/cannot be used in the current
// configuration, positive otherwise (a bigger value means a better sandbox).
// Score may probe the system, so it can be slow.
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  struct Candidate {
    Mode mode;
    create_t create;
    score_t score;
  };

  // Picks the mode of the candidate with the highest positive score. Throws
  // sandbox_unavailable if there is none.
  static Mode Select(const std::vector<Candidate>& candidates);

  // Selects among the registered sandboxes. The probing happens on the first
  // call only: every later call returns the same mode.
  static Mode Resolve();

  // Returns a new instance of the sandbox implementing the given mode.
  static std::unique_ptr<Sandbox> Create(Mode mode);

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // An instance runs one execution at a time; use one instance per thread.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    return ExecuteInternal(options, info, error_msg);
  }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(T::kMode, &T::Create, &T::Score); }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

 private:
  using store_t = std::vector<Candidate>;
  static store_t* Boxes_();
  static void Register_(Mode mode, create_t create, score_t score);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
