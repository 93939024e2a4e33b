#ifndef MANAGER_COMPILER_HPP
#define MANAGER_COMPILER_HPP

#include <string>

#include "util/canceller.hpp"

namespace manager {

struct CompileResult {
  bool success = false;
  // The compiler was killed because the request was cancelled.
  bool cancelled = false;
  // What the compiler printed, verbatim.
  std::string diagnostics;
  // Absolute path of the produced program, if success.
  std::string binary;
};

class Compiler {
 public:
  // Compiles a C translation unit. Everything is written inside workdir.
  // Triggering canceller, if not null, kills the compiler. Throws if the
  // compiler could not be run at all.
  virtual CompileResult Compile(const std::string& source,
                                const std::string& workdir,
                                const util::Canceller* canceller) = 0;

  Compiler() = default;
  virtual ~Compiler() = default;
  Compiler(const Compiler&) = delete;
  Compiler& operator=(const Compiler&) = delete;
};

// Runs the system C compiler as a child process with a wall clock limit.
class CCompiler : public Compiler {
 public:
  // Throws std::domain_error if --compiler cannot be found.
  CCompiler();
  CompileResult Compile(const std::string& source, const std::string& workdir,
                        const util::Canceller* canceller) override;

 private:
  std::string compiler_;
};

}  // namespace manager

#endif
