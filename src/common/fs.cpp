#include "teledrop/common/fs.hpp"

#include <glob.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace teledrop::common {

namespace {

class GlobBuffer {
public:
  GlobBuffer() = default;
  ~GlobBuffer() { globfree(&buffer_); }

  GlobBuffer(const GlobBuffer &) = delete;
  GlobBuffer &operator=(const GlobBuffer &) = delete;

  [[nodiscard]] glob_t *get() { return &buffer_; }

private:
  glob_t buffer_{};
};

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorKind::Configuration, "HOME is not set");
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::vector<std::filesystem::path>> resolve_files(const std::string &pattern) {
  using Paths = std::vector<std::filesystem::path>;
  const std::string expanded = expand_path(trim(pattern));
  if (expanded.empty()) {
    return Result<Paths>::failure(ErrorKind::Configuration, "file pattern is empty");
  }

  GlobBuffer buffer;
  const int rc = ::glob(expanded.c_str(), 0, nullptr, buffer.get());
  if (rc == GLOB_NOMATCH) {
    return Result<Paths>::success({});
  }
  if (rc != 0) {
    return Result<Paths>::failure(ErrorKind::Configuration,
                                  "failed to expand file pattern: " + expanded);
  }

  Paths files;
  files.reserve(buffer.get()->gl_pathc);
  for (std::size_t i = 0; i < buffer.get()->gl_pathc; ++i) {
    std::filesystem::path candidate(buffer.get()->gl_pathv[i]);
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
      files.push_back(std::move(candidate));
    }
  }
  // glob(3) sorts by the current collation; the plan order must not depend on locale.
  std::sort(files.begin(), files.end());
  return Result<Paths>::success(std::move(files));
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return Result<std::string>::failure(ErrorKind::Configuration,
                                        "Unable to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return Result<std::string>::success(buffer.str());
}

} // namespace teledrop::common
