#ifndef MANAGER_HARNESS_HPP
#define MANAGER_HARNESS_HPP

#include <string>
#include <vector>

#include "google/protobuf/struct.pb.h"
#include "proto/cwarden.pb.h"

namespace manager {

// Ends the output record of every test case.
extern const char kRecordSeparator[];

// Canonical spelling of a C type: const qualifiers dropped, whitespace
// collapsed, stars attached to the type ("const int *" becomes "int*").
std::string NormalizeType(const std::string& type);

// Renders value as a C expression of the given parameter type. Throws
// std::invalid_argument if the value does not fit the type or the type is not
// supported.
std::string RenderArgument(const std::string& type,
                           const google::protobuf::Value& value);

// Builds a complete translation unit from the learner's code: the standard
// includes, the code itself and a main() that calls the function once per
// test case, in order, printing one record per call. Throws
// std::invalid_argument on content errors.
std::string GenerateHarness(const std::string& user_code,
                            const proto::FunctionSignature& signature,
                            const std::vector<proto::TestCase>& test_cases);

}  // namespace manager

#endif
