#ifndef MANAGER_EVALUATION_HPP
#define MANAGER_EVALUATION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "proto/cwarden.pb.h"

namespace manager {

// Program output split at the record separator.
struct Records {
  std::vector<std::string> complete;
  // Output after the last separator, if any.
  std::string trailing;
};

Records SplitRecords(const std::string& output);

// Result of a suite whose compilation failed: no test case is evaluated.
proto::TestSuiteResult CompileFailure(int32_t total,
                                      const std::string& diagnostics);

// Pairs the records in output with test_cases, in order. indices[i] is the
// position test_cases[i] had in the request.
proto::TestSuiteResult EvaluateSuite(
    const std::vector<proto::TestCase>& test_cases,
    const std::vector<int32_t>& indices, const std::string& output);

// Checks the output of a free-form run. compiled tells whether compilation
// succeeded, for compile_only.
bool EvaluateCriteria(const proto::SuccessCriteria& criteria, bool compiled,
                      const std::string& output);

}  // namespace manager

#endif  // MANAGER_EVALUATION_HPP
