#include "manifest/runtime_parser.hpp"

#include <ctype.h>
#include <string.h>

#include <algorithm>
#include <map>
#include <vector>

#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "manifest/errors.hpp"
#include "util/misc.hpp"

namespace {

struct Line {
  size_t number;
  size_t indent;
  std::string text;
};

std::string StripComment(const std::string& line) {
  char quote = 0;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '#' && (i == 0 || isspace(line[i - 1]))) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& s) {
  std::string t = util::Trim(s);
  if (t.size() >= 2 && (t[0] == '\'' || t[0] == '"') && t.back() == t[0])
    return t.substr(1, t.size() - 2);
  return t;
}

std::vector<Line> SplitLines(const std::string& contents) {
  std::vector<Line> lines;
  size_t number = 0;
  for (absl::string_view raw : absl::StrSplit(contents, '\n')) {
    number++;
    std::string line = StripComment(std::string(raw));
    if (!line.empty() && line.back() == '\r') line.pop_back();
    size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) continue;
    if (line[indent] == '\t') {
      throw manifest::malformed_runtime("tab indentation on line " +
                                        std::to_string(number));
    }
    std::string text = util::Trim(line.substr(indent));
    if (text.empty() || text == "---") continue;
    lines.push_back(Line{number, indent, text});
  }
  return lines;
}

std::vector<std::string> ParseFlowList(const std::string& value, size_t line) {
  if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
    throw manifest::malformed_runtime("expected a list on line " +
                                      std::to_string(line));
  }
  std::vector<std::string> items;
  for (absl::string_view item :
       absl::StrSplit(value.substr(1, value.size() - 2), ',')) {
    std::string unquoted = Unquote(std::string(item));
    if (!unquoted.empty()) items.push_back(unquoted);
  }
  return items;
}

// Splits "key: value" into its parts. Returns false if text is not a mapping
// entry.
bool SplitKey(const std::string& text, std::string* key, std::string* value) {
  size_t colon = text.find(':');
  while (colon != std::string::npos && colon + 1 < text.size() &&
         !isspace(text[colon + 1])) {
    colon = text.find(':', colon + 1);
  }
  if (colon == std::string::npos) return false;
  *key = util::Trim(text.substr(0, colon));
  *value = util::Trim(text.substr(colon + 1));
  return !key->empty();
}

bool IsNameChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
         c == '.';
}

bool IsVersionChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '*' ||
         c == '+' || c == '!' || c == '_' || c == '-';
}

// Consumes a package name at the start of spec.
std::string TakeName(const std::string& spec, size_t* pos) {
  size_t end = 0;
  while (end < spec.size() && IsNameChar(spec[end])) end++;
  if (end == 0 || !isalnum(static_cast<unsigned char>(spec[0]))) {
    throw manifest::malformed_runtime("invalid package name in \"" + spec +
                                      "\"");
  }
  *pos = end;
  return spec.substr(0, end);
}

// Normalizes a comma-separated list of "op version" items. Single '=' is the
// conda prefix match, and "v=build" pins v exactly.
std::string NormalizeConstraint(const std::string& raw,
                                const std::string& spec, bool pip) {
  static const char* const kOps[] = {"===", "==", ">=", "<=", "!=",
                                     "~=",  ">",  "<",  "="};
  std::vector<std::string> items;
  for (absl::string_view item_view : absl::StrSplit(raw, ',')) {
    std::string item;
    for (char c : item_view)
      if (!isspace(static_cast<unsigned char>(c))) item += c;
    std::string op;
    for (const char* candidate : kOps) {
      if (item.compare(0, strlen(candidate), candidate) == 0) {
        op = candidate;
        break;
      }
    }
    if (op.empty() || (pip && op == "=")) {
      throw manifest::malformed_runtime("invalid version constraint in \"" +
                                        spec + "\"");
    }
    std::string version = item.substr(op.size());
    if (op == "===") op = "==";
    size_t build = version.find('=');
    if (op == "=" && build != std::string::npos) {
      version = version.substr(0, build);
      op = "==";
    }
    bool wildcard = false;
    while (!version.empty() && (version.back() == '*' || version.back() == '.')) {
      wildcard = true;
      version.pop_back();
    }
    if (wildcard && op == "==") op = "=";
    if (version.empty() ||
        std::find_if_not(version.begin(), version.end(), IsVersionChar) !=
            version.end() ||
        version.find('*') != std::string::npos) {
      throw manifest::malformed_runtime("invalid version in \"" + spec + "\"");
    }
    items.push_back(op + version);
  }
  return absl::StrJoin(items, ",");
}

}  // namespace

namespace manifest {

std::string CanonicalName(const std::string& name, bool pip) {
  std::string canonical = util::ToLower(name);
  if (pip) {
    for (char& c : canonical)
      if (c == '_' || c == '.') c = '-';
  }
  return canonical;
}

proto::Dependency ParseCondaRequirement(const std::string& raw) {
  std::string spec = Unquote(raw);
  proto::Dependency dependency;
  size_t sep = spec.find("::");
  if (sep != std::string::npos) {
    std::string channel = util::Trim(spec.substr(0, sep));
    if (channel.empty()) throw malformed_runtime("empty channel in " + spec);
    dependency.set_channel(channel);
    spec = util::Trim(spec.substr(sep + 2));
  }
  size_t pos = 0;
  dependency.set_name(CanonicalName(TakeName(spec, &pos), false));
  std::string rest = util::Trim(spec.substr(pos));
  if (rest.empty()) return dependency;
  if (rest[0] != '=' && rest[0] != '<' && rest[0] != '>' && rest[0] != '!' &&
      rest[0] != '~') {
    // "name version [build]" form.
    std::vector<std::string> parts = util::split(rest, ' ');
    if (parts.size() > 2) throw malformed_runtime("invalid spec " + spec);
    if (parts.size() == 2) {
      rest = "==" + parts[0];
    } else if (parts[0].find_first_of("<>=!~") != std::string::npos) {
      rest = parts[0];
    } else {
      rest = "=" + parts[0];
    }
  }
  dependency.set_constraint(NormalizeConstraint(rest, spec, false));
  return dependency;
}

proto::Dependency ParsePipRequirement(const std::string& raw) {
  std::string spec = Unquote(raw);
  size_t marker = spec.find(';');
  if (marker != std::string::npos) spec = util::Trim(spec.substr(0, marker));
  if (spec.empty() || spec[0] == '-' ||
      spec.find("://") != std::string::npos ||
      spec.find('@') != std::string::npos) {
    throw malformed_runtime("unsupported pip requirement \"" + spec + "\"");
  }
  proto::Dependency dependency;
  dependency.set_channel(kPipChannel);
  size_t pos = 0;
  dependency.set_name(CanonicalName(TakeName(spec, &pos), true));
  std::string rest = util::Trim(spec.substr(pos));
  if (!rest.empty() && rest[0] == '[') {
    size_t close = rest.find(']');
    if (close == std::string::npos)
      throw malformed_runtime("unterminated extras in \"" + spec + "\"");
    rest = util::Trim(rest.substr(close + 1));
  }
  if (!rest.empty()) {
    dependency.set_constraint(NormalizeConstraint(rest, spec, true));
  }
  return dependency;
}

proto::RuntimeDescriptor ParseRuntime(const std::string& contents) {
  proto::RuntimeDescriptor descriptor;
  std::map<std::string, int> seen;
  auto add = [&descriptor, &seen](proto::Dependency dependency) {
    std::string key = (dependency.channel() == kPipChannel ? "pip:" : "conda:") +
                      dependency.name();
    auto it = seen.find(key);
    if (it == seen.end()) {
      seen.emplace(key, descriptor.dependency_size());
      *descriptor.add_dependency() = std::move(dependency);
      return;
    }
    const proto::Dependency& previous = descriptor.dependency(it->second);
    if (previous.constraint() != dependency.constraint() ||
        previous.channel() != dependency.channel()) {
      throw malformed_runtime("conflicting constraints for " +
                              dependency.name() + ": \"" +
                              previous.constraint() + "\" and \"" +
                              dependency.constraint() + "\"");
    }
    VLOG(1) << "Ignoring duplicate dependency " << dependency.name();
  };

  std::string section;
  bool in_pip = false;
  size_t pip_indent = 0;
  for (const Line& line : SplitLines(contents)) {
    bool is_item = line.text[0] == '-' &&
                   (line.text.size() == 1 || isspace(line.text[1]));
    if (line.indent == 0 && !is_item) {
      std::string key;
      std::string value;
      if (!SplitKey(line.text, &key, &value)) {
        throw malformed_runtime("expected \"key: value\" on line " +
                                std::to_string(line.number));
      }
      section = key;
      in_pip = false;
      if (key == "name") {
        descriptor.set_name(Unquote(value));
      } else if (key == "channels" && !value.empty()) {
        for (const std::string& channel : ParseFlowList(value, line.number))
          descriptor.add_channels(channel);
      } else if (key == "dependencies" && !value.empty()) {
        for (const std::string& dep : ParseFlowList(value, line.number))
          add(ParseCondaRequirement(dep));
      } else if (key != "channels" && key != "dependencies") {
        VLOG(1) << "Ignoring key " << key << " in the runtime descriptor";
      }
      continue;
    }
    if (section != "channels" && section != "dependencies") {
      if (section.empty()) {
        throw malformed_runtime("unexpected content on line " +
                                std::to_string(line.number));
      }
      continue;
    }
    if (!is_item) {
      throw malformed_runtime("expected a list item on line " +
                              std::to_string(line.number));
    }
    std::string item = util::Trim(line.text.substr(1));
    if (item.empty()) {
      throw malformed_runtime("empty list item on line " +
                              std::to_string(line.number));
    }
    if (section == "channels") {
      descriptor.add_channels(Unquote(item));
      continue;
    }
    if (in_pip && line.indent > pip_indent) {
      add(ParsePipRequirement(item));
      continue;
    }
    in_pip = false;
    std::string key;
    std::string value;
    if (SplitKey(item, &key, &value)) {
      if (key != "pip") {
        throw malformed_runtime("unexpected mapping \"" + key + "\" on line " +
                                std::to_string(line.number));
      }
      if (!value.empty()) {
        for (const std::string& dep : ParseFlowList(value, line.number))
          add(ParsePipRequirement(dep));
      } else {
        in_pip = true;
        pip_indent = line.indent;
      }
      continue;
    }
    add(ParseCondaRequirement(item));
  }
  return descriptor;
}

}  // namespace manifest
