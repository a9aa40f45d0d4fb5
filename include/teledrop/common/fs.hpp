#pragma once

#include "teledrop/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace teledrop::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

/// Resolve a file path or glob pattern to the regular files it names, sorted by path.
/// An empty vector means nothing matched.
[[nodiscard]] Result<std::vector<std::filesystem::path>> resolve_files(const std::string &pattern);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

} // namespace teledrop::common
