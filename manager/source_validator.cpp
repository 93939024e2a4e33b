#include "manager/source_validator.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/match.h"

namespace manager {

namespace {
const char* const kBlockedCalls[] = {"system(", "exec(", "popen(", "fork("};
}  // namespace

std::string ValidationError::Message() const {
  switch (kind) {
    case TOO_LARGE:
      return absl::StrCat("Source code too large: ", detail, " bytes");
    case DANGEROUS_CALL:
      return absl::StrCat("Use of ", detail, ") is not allowed");
  }
  return detail;
}

absl::optional<ValidationError> ValidateSource(const std::string& source,
                                               size_t max_bytes) {
  if (source.size() > max_bytes) {
    return ValidationError{ValidationError::TOO_LARGE,
                           std::to_string(source.size())};
  }
  for (const char* call : kBlockedCalls) {
    if (absl::StrContains(source, call)) {
      return ValidationError{ValidationError::DANGEROUS_CALL, call};
    }
  }
  return absl::nullopt;
}

}  // namespace manager
