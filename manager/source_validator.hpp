#ifndef MANAGER_SOURCE_VALIDATOR_HPP
#define MANAGER_SOURCE_VALIDATOR_HPP

#include <cstddef>
#include <string>

#include "absl/types/optional.h"

namespace manager {

struct ValidationError {
  enum Kind { TOO_LARGE, DANGEROUS_CALL };
  Kind kind;
  // The blocked call for DANGEROUS_CALL, the size for TOO_LARGE.
  std::string detail;

  std::string Message() const;
};

// Coarse pre-compilation check of a submission. This is not a security
// boundary: the sandbox is.
absl::optional<ValidationError> ValidateSource(const std::string& source,
                                               size_t max_bytes);

}  // namespace manager

#endif
