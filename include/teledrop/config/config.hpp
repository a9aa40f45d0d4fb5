#pragma once

#include "teledrop/common/result.hpp"
#include "teledrop/config/schema.hpp"
#include "teledrop/dispatch/types.hpp"
#include "teledrop/transport/transport.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace teledrop::config {

/// Reads a flat JSON object on top of base. Unknown keys are ignored; a missing,
/// unreadable or malformed file fails with ErrorKind::Configuration.
[[nodiscard]] common::Result<DispatcherConfig> load_config_file(const std::filesystem::path &path,
                                                                DispatcherConfig base = {});

/// Applies the members of a flat JSON object on top of config.
[[nodiscard]] common::Status apply_json(DispatcherConfig &config, const std::string &json);

[[nodiscard]] std::string to_json(const DispatcherConfig &config);
[[nodiscard]] common::Status save_config_file(const DispatcherConfig &config,
                                              const std::filesystem::path &path);

/// TELEDROP_* variables override; the CI-style BOT_TOKEN, CHAT_ID and THREAD_ID only
/// fill fields that are still unset.
[[nodiscard]] common::Status apply_env_overrides(DispatcherConfig &config);

/// Rejects incomplete or out-of-range configuration; returns warnings otherwise.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const DispatcherConfig &config);

[[nodiscard]] dispatch::DispatchRequest to_request(const DispatcherConfig &config,
                                                   std::vector<dispatch::FileRef> files);
[[nodiscard]] dispatch::RetryPolicy to_policy(const DispatcherConfig &config);
[[nodiscard]] transport::Credentials to_credentials(const DispatcherConfig &config);

[[nodiscard]] common::Result<std::int64_t> parse_int64(const std::string &raw,
                                                       const std::string &field);

} // namespace teledrop::config
