#include "manager/harness.hpp"

#include <cctype>
#include <cfloat>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

namespace manager {

const char kRecordSeparator[] = "\x1e\n";

namespace {

enum class Kind { SIGNED, UNSIGNED, FLOATING, CHAR, BOOL };

struct ScalarType {
  const char* name;
  Kind kind;
  const char* suffix;
  const char* format;
  // 32 means float for FLOATING.
  int bits;
};

// Sizes are those of LP64.
const ScalarType kScalarTypes[] = {
    {"int", Kind::SIGNED, "", "%d", 32},
    {"short", Kind::SIGNED, "", "%d", 16},
    {"long", Kind::SIGNED, "L", "%ld", 64},
    {"long long", Kind::SIGNED, "LL", "%lld", 64},
    {"unsigned int", Kind::UNSIGNED, "U", "%u", 32},
    {"unsigned short", Kind::UNSIGNED, "U", "%u", 16},
    {"unsigned long", Kind::UNSIGNED, "UL", "%lu", 64},
    {"unsigned long long", Kind::UNSIGNED, "ULL", "%llu", 64},
    {"size_t", Kind::UNSIGNED, "UL", "%zu", 64},
    {"float", Kind::FLOATING, "f", "%f", 32},
    {"double", Kind::FLOATING, "", "%f", 64},
    {"char", Kind::CHAR, "", "%c", 8},
    {"bool", Kind::BOOL, "", "%d", 1},
};

const struct {
  const char* from;
  const char* to;
} kTypeAliases[] = {
    {"signed", "int"},
    {"signed int", "int"},
    {"unsigned", "unsigned int"},
    {"short int", "short"},
    {"signed short", "short"},
    {"unsigned short int", "unsigned short"},
    {"long int", "long"},
    {"signed long", "long"},
    {"unsigned long int", "unsigned long"},
    {"long long int", "long long"},
    {"unsigned long long int", "unsigned long long"},
    {"_Bool", "bool"},
};

const ScalarType* FindScalar(const std::string& name) {
  for (const ScalarType& type : kScalarTypes) {
    if (name == type.name) return &type;
  }
  return nullptr;
}

// A normalized type split into its base and the number of stars.
struct ParsedType {
  std::string base;
  int pointers = 0;
};

ParsedType ParseType(const std::string& type) {
  std::string normalized = NormalizeType(type);
  ParsedType parsed;
  size_t star = normalized.find('*');
  parsed.base = normalized.substr(0, star);
  if (star != std::string::npos) {
    parsed.pointers = normalized.size() - star;
  }
  return parsed;
}

std::string Describe(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
      return "null";
    case google::protobuf::Value::kNumberValue:
      return absl::StrCat("number ", value.number_value());
    case google::protobuf::Value::kStringValue:
      return absl::StrCat("string \"", value.string_value(), "\"");
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kListValue:
      return "list";
    case google::protobuf::Value::kStructValue:
      return "object";
    default:
      return "empty value";
  }
}

[[noreturn]] void Mismatch(const std::string& type,
                           const google::protobuf::Value& value) {
  throw std::invalid_argument(
      absl::StrCat("Cannot pass ", Describe(value), " as ", type));
}

bool IsNull(const google::protobuf::Value& value) {
  return value.kind_case() == google::protobuf::Value::kNullValue ||
         (value.kind_case() == google::protobuf::Value::kStringValue &&
          value.string_value() == "NULL");
}

std::string EscapeChar(unsigned char c, char quote) {
  switch (c) {
    case '\\':
      return "\\\\";
    case '\n':
      return "\\n";
    case '\t':
      return "\\t";
    case '\r':
      return "\\r";
    case '?':
      // Keeps trigraphs from forming.
      return "\\?";
    default:
      break;
  }
  if (c == static_cast<unsigned char>(quote)) return std::string("\\") + quote;
  if (c < 0x20 || c >= 0x7f) return absl::StrFormat("\\%03o", c);
  return std::string(1, c);
}

std::string RenderInteger(const ScalarType& type,
                          const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kNumberValue) {
    Mismatch(type.name, value);
  }
  double number = value.number_value();
  if (!std::isfinite(number) || std::trunc(number) != number) {
    Mismatch(type.name, value);
  }
  if (type.kind == Kind::UNSIGNED) {
    // 2^bits, exact in a double.
    double limit = std::ldexp(1.0, type.bits);
    if (number < 0 || number >= limit) Mismatch(type.name, value);
    return absl::StrCat(static_cast<uint64_t>(number), type.suffix);
  }
  double limit = std::ldexp(1.0, type.bits - 1);
  if (number < -limit || number >= limit) Mismatch(type.name, value);
  int64_t integer = static_cast<int64_t>(number);
  if (integer == INT64_MIN) {
    // The literal 9223372036854775808 does not fit any signed type.
    return absl::StrCat("(-9223372036854775807", type.suffix, " - 1)");
  }
  return absl::StrCat(integer, type.suffix);
}

std::string RenderFloating(const ScalarType& type,
                           const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kNumberValue) {
    Mismatch(type.name, value);
  }
  double number = value.number_value();
  if (!std::isfinite(number) || (type.bits == 32 && std::fabs(number) > FLT_MAX)) {
    Mismatch(type.name, value);
  }
  std::string text = absl::StrFormat("%.17g", number);
  if (text.find_first_of(".e") == std::string::npos) text += ".0";
  return text + type.suffix;
}

std::string RenderScalar(const ScalarType& type,
                         const google::protobuf::Value& value) {
  switch (type.kind) {
    case Kind::SIGNED:
    case Kind::UNSIGNED:
      return RenderInteger(type, value);
    case Kind::FLOATING:
      return RenderFloating(type, value);
    case Kind::CHAR:
      if (value.kind_case() != google::protobuf::Value::kStringValue ||
          value.string_value().size() != 1) {
        Mismatch(type.name, value);
      }
      return "'" + EscapeChar(value.string_value()[0], '\'') + "'";
    case Kind::BOOL:
      if (value.kind_case() != google::protobuf::Value::kBoolValue) {
        Mismatch(type.name, value);
      }
      return value.bool_value() ? "true" : "false";
  }
  Mismatch(type.name, value);
}

std::string RenderString(const google::protobuf::Value& value) {
  if (IsNull(value)) return "NULL";
  if (value.kind_case() != google::protobuf::Value::kStringValue) {
    Mismatch("char*", value);
  }
  std::string literal = "\"";
  for (char c : value.string_value()) literal += EscapeChar(c, '"');
  return literal + "\"";
}

std::string RenderPointer(const ScalarType& type,
                          const google::protobuf::Value& value) {
  if (IsNull(value)) return "NULL";
  if (value.kind_case() == google::protobuf::Value::kListValue) {
    const auto& elements = value.list_value().values();
    if (elements.empty()) {
      // Empty initializer lists are not valid C11.
      return absl::StrCat("(", type.name, "[1]){ 0 }");
    }
    std::vector<std::string> rendered;
    for (const google::protobuf::Value& element : elements) {
      rendered.push_back(RenderScalar(type, element));
    }
    return absl::StrCat("(", type.name, "[]){ ", absl::StrJoin(rendered, ", "),
                        " }");
  }
  return absl::StrCat("&(", type.name, "){ ", RenderScalar(type, value), " }");
}

// printf statement for a variable named result of the given return type, or
// an empty string for void.
std::string PrintResult(const std::string& return_type) {
  ParsedType parsed = ParseType(return_type);
  if (parsed.base == "void" && parsed.pointers == 0) return "";
  if (parsed.base == "char" && parsed.pointers == 1) {
    return "printf(\"%s\\n\", result ? result : \"(null)\");";
  }
  const ScalarType* scalar = FindScalar(parsed.base);
  if (scalar == nullptr || parsed.pointers != 0) {
    throw std::invalid_argument("Unsupported return type: " + return_type);
  }
  if (scalar->kind == Kind::BOOL) return "printf(\"%d\\n\", result ? 1 : 0);";
  return absl::StrCat("printf(\"", scalar->format, "\\n\", result);");
}

std::string ResultDeclaration(const std::string& return_type) {
  ParsedType parsed = ParseType(return_type);
  if (parsed.base == "char" && parsed.pointers == 1) return "const char* result";
  return parsed.base + " result";
}

bool IsIdentifier(const std::string& name) {
  if (name.empty() || isdigit(static_cast<unsigned char>(name[0]))) {
    return false;
  }
  for (char c : name) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

}  // namespace

std::string NormalizeType(const std::string& type) {
  std::vector<std::string> words;
  int pointers = 0;
  std::string word;
  auto flush = [&words, &word]() {
    if (!word.empty() && word != "const") words.push_back(word);
    word.clear();
  };
  for (char c : type) {
    if (isspace(static_cast<unsigned char>(c))) {
      flush();
    } else if (c == '*') {
      flush();
      pointers++;
    } else {
      word += c;
    }
  }
  flush();
  std::string base = absl::StrJoin(words, " ");
  for (const auto& alias : kTypeAliases) {
    if (base == alias.from) base = alias.to;
  }
  return base + std::string(pointers, '*');
}

std::string RenderArgument(const std::string& type,
                           const google::protobuf::Value& value) {
  ParsedType parsed = ParseType(type);
  if (parsed.base == "char" && parsed.pointers == 1) return RenderString(value);
  const ScalarType* scalar = FindScalar(parsed.base);
  if (scalar == nullptr || parsed.pointers > 1) {
    throw std::invalid_argument("Unsupported parameter type: " + type);
  }
  if (parsed.pointers == 1) return RenderPointer(*scalar, value);
  if (value.kind_case() == google::protobuf::Value::kListValue) {
    Mismatch(type, value);
  }
  return RenderScalar(*scalar, value);
}

std::string GenerateHarness(const std::string& user_code,
                            const proto::FunctionSignature& signature,
                            const std::vector<proto::TestCase>& test_cases) {
  if (!IsIdentifier(signature.name())) {
    throw std::invalid_argument("Invalid function name: " + signature.name());
  }
  const std::string print = PrintResult(signature.return_type());
  const std::string declaration = ResultDeclaration(signature.return_type());

  std::string main_body;
  for (size_t i = 0; i < test_cases.size(); i++) {
    const proto::TestCase& test_case = test_cases[i];
    if (test_case.input_size() != signature.parameters_size()) {
      throw std::invalid_argument(absl::StrCat(
          "Test case ", i, ": expected ", signature.parameters_size(),
          " arguments, got ", test_case.input_size()));
    }
    std::vector<std::string> args;
    for (int p = 0; p < signature.parameters_size(); p++) {
      try {
        args.push_back(RenderArgument(signature.parameters(p).type(),
                                      test_case.input(p)));
      } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(
            absl::StrCat("Test case ", i, ", parameter ",
                         signature.parameters(p).name(), ": ", e.what()));
      }
    }
    std::string call =
        absl::StrCat(signature.name(), "(", absl::StrJoin(args, ", "), ")");
    absl::StrAppend(&main_body, "  /* test ", i, " */\n  {\n");
    if (print.empty()) {
      absl::StrAppend(&main_body, "    ", call, ";\n");
    } else {
      absl::StrAppend(&main_body, "    ", declaration, " = ", call, ";\n",
                      "    ", print, "\n");
    }
    absl::StrAppend(&main_body, "  }\n", "  fputs(\"\\036\\n\", stdout);\n",
                    "  fflush(stdout);\n");
  }

  return absl::StrCat(
      "#include <stdio.h>\n"
      "#include <stdlib.h>\n"
      "#include <string.h>\n"
      "#include <stdbool.h>\n"
      "\n",
      user_code,
      "\n\n"
      "int main(void) {\n",
      main_body,
      "  return 0;\n"
      "}\n");
}

}  // namespace manager
