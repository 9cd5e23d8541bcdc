#include "BatchCommand.hpp"

#include <charconv>
#include <cmath>

namespace igv {
CommandArg::CommandArg(double value) {
  if (!std::isfinite(value)) {
    throw InvalidArgument("Numeric argument must be finite");
  }
  // to_chars is locale independent and round-trips exactly
  char buf[64];
  auto result = std::to_chars(buf, buf + sizeof(buf), value);
  if (result.ec != std::errc()) {
    throw InvalidArgument("Cannot format numeric argument");
  }
  text = string(buf, result.ptr);
}

string encodeCommand(const string& name, const vector<CommandArg>& args) {
  if (trim(name).empty()) {
    throw InvalidArgument("Command name must not be empty");
  }
  string line = name;
  for (const auto& arg : args) {
    if (arg.isAbsent()) {
      continue;
    }
    line += " ";
    line += arg.value();
  }
  line = trim(line);
  if (line.find_first_of("\r\n") != string::npos) {
    throw InvalidArgument("Batch commands are one line; got a line break in: " +
                          line);
  }
  return line;
}

string expandPath(const string& path) {
  string expanded = path;
  if (!expanded.empty() && expanded[0] == '~' &&
      (expanded.size() == 1 || expanded[1] == '/')) {
    const char* home = ::getenv("HOME");
    if (home == NULL) {
      struct passwd* pw = ::getpwuid(::getuid());
      home = pw ? pw->pw_dir : NULL;
    }
    if (home != NULL) {
      expanded = string(home) + expanded.substr(1);
    }
  }
  string result = fs::absolute(fs::path(expanded)).lexically_normal().string();
  while (result.size() > 1 && result.back() == '/') {
    result.pop_back();
  }
  return result;
}

bool hasUriScheme(const string& text) {
  auto colon = text.find(':');
  if (colon == string::npos || colon == 0) {
    return false;
  }
  if (!isalpha(static_cast<unsigned char>(text[0]))) {
    return false;
  }
  for (size_t i = 1; i < colon; i++) {
    unsigned char c = text[i];
    if (!isalnum(c) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  // Characters that can never appear in a URI make it malformed, and a
  // malformed URI is taken to be a local path.
  for (unsigned char c : text) {
    if (isspace(c) || iscntrl(c) || strchr("<>\"{}|\\^`", c) != NULL) {
      return false;
    }
  }
  return true;
}

string pathOrUrl(const string& text) {
  if (hasUriScheme(text)) {
    return text;
  }
  return expandPath(text);
}

string genomeArgument(const string& nameOrPath) {
  string path = expandPath(nameOrPath);
  std::error_code ec;
  if (fs::exists(path, ec)) {
    return path;
  }
  return nameOrPath;
}

const vector<string>& sortOptions() {
  static const vector<string> options = {"base",    "position", "strand",
                                         "quality", "sample",   "readGroup"};
  return options;
}

void validateSortOption(const string& option) {
  const auto& options = sortOptions();
  if (std::find(options.begin(), options.end(), option) != options.end()) {
    return;
  }
  string valid;
  for (size_t i = 0; i < options.size(); i++) {
    if (i) {
      valid += ", ";
    }
    valid += options[i];
  }
  throw InvalidOption("Invalid sort option '" + option +
                      "'; options are one of: " + valid);
}

void validateStrand(const string& strand) {
  if (strand != "+" && strand != "-") {
    throw InvalidOption("Invalid strand '" + strand + "'; use + or -");
  }
}
}  // namespace igv
