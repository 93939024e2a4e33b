#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs programs on this machine under the given sandbox mode. Safe to use
// from many threads at once: every execution gets its own sandbox instance.
class LocalExecutor : public Executor {
 public:
  explicit LocalExecutor(sandbox::Mode mode) : mode_(mode) {}
  ~LocalExecutor() override = default;

  ExecutionOutcome Execute(const ExecutionRequest& request) override;

  sandbox::Mode mode() const { return mode_; }

 private:
  static const constexpr int32_t kMaxFiles = 64;

  const sandbox::Mode mode_;
};

}  // namespace executor

#endif
