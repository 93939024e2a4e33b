#include "manager/evaluation.hpp"

#include <regex>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "manager/harness.hpp"

namespace manager {

namespace {
std::string TrimOneNewline(std::string text) {
  if (!text.empty() && text.back() == '\n') text.pop_back();
  return text;
}

size_t CountOccurrences(const std::string& text, const std::string& token) {
  if (token.empty()) return 0;
  size_t count = 0;
  for (size_t pos = text.find(token); pos != std::string::npos;
       pos = text.find(token, pos + token.size())) {
    count++;
  }
  return count;
}
}  // namespace

Records SplitRecords(const std::string& output) {
  Records records;
  records.complete = absl::StrSplit(output, kRecordSeparator);
  // The last piece is never followed by a separator.
  records.trailing = std::move(records.complete.back());
  records.complete.pop_back();
  return records;
}

proto::TestSuiteResult CompileFailure(int32_t total,
                                      const std::string& diagnostics) {
  proto::TestSuiteResult result;
  result.set_passed(false);
  result.set_total(total);
  result.set_passed_count(0);
  result.set_compilation_error(diagnostics);
  result.set_status(proto::Status::COMPILE_ERROR);
  return result;
}

proto::TestSuiteResult EvaluateSuite(
    const std::vector<proto::TestCase>& test_cases,
    const std::vector<int32_t>& indices, const std::string& output) {
  CHECK_EQ(test_cases.size(), indices.size());
  Records records = SplitRecords(output);

  proto::TestSuiteResult result;
  int32_t passed_count = 0;
  for (size_t i = 0; i < test_cases.size(); i++) {
    const proto::TestCase& test_case = test_cases[i];
    proto::TestCaseResult* test_result = result.add_results();
    test_result->set_index(indices[i]);
    *test_result->mutable_input() = test_case.input();
    test_result->set_expected(test_case.expected());
    test_result->set_sample(test_case.sample());
    if (i < records.complete.size()) {
      std::string actual = TrimOneNewline(records.complete[i]);
      test_result->set_passed(actual == test_case.expected());
      test_result->set_actual(std::move(actual));
    } else if (i == records.complete.size() && !records.trailing.empty()) {
      // The program died in the middle of this test.
      test_result->set_actual(TrimOneNewline(records.trailing));
      test_result->set_passed(false);
    } else {
      test_result->set_passed(false);
    }
    if (test_result->passed()) passed_count++;
  }
  result.set_total(test_cases.size());
  result.set_passed_count(passed_count);
  result.set_passed(passed_count == static_cast<int32_t>(test_cases.size()));
  result.set_status(result.passed() ? proto::Status::SUCCESS
                                    : proto::Status::WRONG_OUTPUT);
  return result;
}

bool EvaluateCriteria(const proto::SuccessCriteria& criteria, bool compiled,
                      const std::string& output) {
  switch (criteria.kind_case()) {
    case proto::SuccessCriteria::kExactMatch:
      return absl::StripAsciiWhitespace(output) ==
             absl::StripAsciiWhitespace(
                 criteria.exact_match().expected_stdout());
    case proto::SuccessCriteria::kRegexMatch:
      try {
        return std::regex_search(output,
                                 std::regex(criteria.regex_match().regex()));
      } catch (const std::regex_error& e) {
        VLOG(1) << "Invalid regex " << criteria.regex_match().regex() << ": "
                << e.what();
        return false;
      }
    case proto::SuccessCriteria::kOutputCount:
      return criteria.output_count().count() >= 0 &&
             CountOccurrences(output, criteria.output_count().token()) ==
                 static_cast<size_t>(criteria.output_count().count());
    case proto::SuccessCriteria::kCompileOnly:
      return compiled;
    case proto::SuccessCriteria::kAll:
      for (const proto::SuccessCriteria& c : criteria.all().criteria()) {
        if (!EvaluateCriteria(c, compiled, output)) return false;
      }
      return true;
    case proto::SuccessCriteria::kAny:
      for (const proto::SuccessCriteria& c : criteria.any().criteria()) {
        if (EvaluateCriteria(c, compiled, output)) return true;
      }
      return false;
    case proto::SuccessCriteria::KIND_NOT_SET:
      return true;
  }
  return true;
}

}  // namespace manager
