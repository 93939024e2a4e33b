#ifndef MANAGER_ENGINE_HPP
#define MANAGER_ENGINE_HPP

#include "executor/executor.hpp"
#include "manager/compiler.hpp"
#include "proto/cwarden.pb.h"
#include "util/canceller.hpp"

namespace manager {

// The compile-and-run pipeline: validation, compilation in a request-scoped
// directory, sandboxed execution and evaluation. Methods can be called from
// many threads at once.
class Engine {
 public:
  // Does not take ownership.
  Engine(Compiler* compiler, executor::Executor* executor)
      : compiler_(compiler), executor_(executor) {}

  // Free-form run of a whole program.
  proto::RunResponse Run(const proto::RunRequest& request,
                         const util::Canceller* canceller = nullptr);

  // Runs a single function against test cases. Throws std::invalid_argument
  // if the request content is malformed.
  proto::TestSuiteResult RunTests(const proto::HarnessRequest& request,
                                  const util::Canceller* canceller = nullptr);

 private:
  Compiler* compiler_;
  executor::Executor* executor_;
};

}  // namespace manager

#endif
