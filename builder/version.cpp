#include "builder/version.hpp"

#include <ctype.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "absl/strings/str_split.h"

namespace {

struct Token {
  bool numeric;
  std::string value;
};

std::vector<Token> Tokenize(const std::string& version) {
  std::vector<Token> tokens;
  size_t i = 0;
  while (i < version.size()) {
    unsigned char c = version[i];
    if (!isalnum(c)) {
      i++;
      continue;
    }
    bool numeric = isdigit(c);
    size_t start = i;
    while (i < version.size() &&
           (numeric ? isdigit(static_cast<unsigned char>(version[i]))
                    : isalpha(static_cast<unsigned char>(version[i])))) {
      i++;
    }
    std::string value = version.substr(start, i - start);
    if (numeric) {
      size_t nonzero = value.find_first_not_of('0');
      value = nonzero == std::string::npos ? "0" : value.substr(nonzero);
    } else {
      for (char& ch : value) ch = tolower(static_cast<unsigned char>(ch));
    }
    tokens.push_back(Token{numeric, value});
  }
  return tokens;
}

int CompareTokens(const Token& first, const Token& second) {
  if (first.numeric != second.numeric) return first.numeric ? 1 : -1;
  if (first.numeric && first.value.size() != second.value.size())
    return first.value.size() < second.value.size() ? -1 : 1;
  return first.value.compare(second.value);
}

// Compares what is left of a version after the other one ran out.
int CompareTail(const std::vector<Token>& tokens, size_t from) {
  for (size_t i = from; i < tokens.size(); i++) {
    if (!tokens[i].numeric) return -1;
    if (tokens[i].value != "0") return 1;
  }
  return 0;
}

bool IsPrefix(const std::string& prefix, const std::string& version) {
  std::vector<Token> p = Tokenize(prefix);
  std::vector<Token> v = Tokenize(version);
  if (p.size() > v.size()) return false;
  for (size_t i = 0; i < p.size(); i++) {
    if (CompareTokens(p[i], v[i]) != 0) return false;
  }
  return true;
}

bool SatisfiesItem(const std::string& version, const std::string& item) {
  static const char* const kOps[] = {"==", ">=", "<=", "!=", "~=",
                                     ">",  "<",  "="};
  for (const char* op_ptr : kOps) {
    std::string op = op_ptr;
    if (item.compare(0, op.size(), op) != 0) continue;
    std::string target = item.substr(op.size());
    int cmp = builder::CompareVersions(version, target);
    if (op == "==") return cmp == 0;
    if (op == ">=") return cmp >= 0;
    if (op == "<=") return cmp <= 0;
    if (op == "!=") return cmp != 0;
    if (op == ">") return cmp > 0;
    if (op == "<") return cmp < 0;
    if (op == "=") return IsPrefix(target, version);
    // Compatible release: at least target, same series.
    size_t last = target.find_last_of('.');
    return cmp >= 0 &&
           (last == std::string::npos || IsPrefix(target.substr(0, last),
                                                  version));
  }
  throw std::invalid_argument("Invalid version constraint " + item);
}

}  // namespace

namespace builder {

int CompareVersions(const std::string& first, const std::string& second) {
  std::vector<Token> a = Tokenize(first);
  std::vector<Token> b = Tokenize(second);
  size_t common = std::min(a.size(), b.size());
  for (size_t i = 0; i < common; i++) {
    int cmp = CompareTokens(a[i], b[i]);
    if (cmp != 0) return cmp < 0 ? -1 : 1;
  }
  if (a.size() > common) return CompareTail(a, common);
  if (b.size() > common) return -CompareTail(b, common);
  return 0;
}

bool Satisfies(const std::string& version, const std::string& constraint) {
  if (constraint.empty()) return true;
  for (absl::string_view item : absl::StrSplit(constraint, ',')) {
    if (!SatisfiesItem(version, std::string(item))) return false;
  }
  return true;
}

std::string ExactPin(const std::string& constraint) {
  if (constraint.compare(0, 2, "==") != 0 ||
      constraint.find(',') != std::string::npos) {
    return "";
  }
  return constraint.substr(2);
}

}  // namespace builder
