#include "teledrop/config/config.hpp"

#include "teledrop/common/fs.hpp"
#include "teledrop/common/json_util.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace teledrop::config {

namespace {

common::Status config_error(std::string message) {
  return common::Status::error(common::ErrorKind::Configuration, std::move(message));
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

common::Status parse_bool_field(const std::string &raw, const std::string &field, bool &out) {
  const std::string normalized = common::to_lower(common::trim(raw));
  if (normalized == "true") {
    out = true;
    return common::Status::success();
  }
  if (normalized == "false") {
    out = false;
    return common::Status::success();
  }
  return config_error("invalid boolean for " + field + ": " + raw);
}

common::Status assign_int(const common::JsonFlatMap &values, const std::string &field,
                          std::int64_t &out) {
  const auto it = values.find(field);
  if (it == values.end()) {
    return common::Status::success();
  }
  auto parsed = parse_int64(it->second, field);
  if (!parsed.ok()) {
    return parsed.status();
  }
  out = parsed.value();
  return common::Status::success();
}

common::Status assign_optional_int(const common::JsonFlatMap &values, const std::string &field,
                                   std::optional<std::int64_t> &out) {
  const auto it = values.find(field);
  if (it == values.end()) {
    return common::Status::success();
  }
  auto parsed = parse_int64(it->second, field);
  if (!parsed.ok()) {
    return parsed.status();
  }
  out = parsed.value();
  return common::Status::success();
}

void assign_string(const common::JsonFlatMap &values, const std::string &field, std::string &out) {
  if (const auto it = values.find(field); it != values.end()) {
    out = it->second;
  }
}

void assign_optional_string(const common::JsonFlatMap &values, const std::string &field,
                            std::optional<std::string> &out) {
  if (const auto it = values.find(field); it != values.end()) {
    out = it->second;
  }
}

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

std::string optional_json(const std::optional<std::string> &value) {
  return value.has_value() ? quoted(*value) : "null";
}

std::string optional_json(const std::optional<std::int64_t> &value) {
  return value.has_value() ? std::to_string(*value) : "null";
}

std::string bool_json(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::int64_t> parse_int64(const std::string &raw, const std::string &field) {
  const std::string normalized = common::trim(raw);
  std::int64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (normalized.empty() || ec != std::errc() || ptr != last) {
    return common::Result<std::int64_t>::failure(common::ErrorKind::Configuration,
                                                 "invalid integer for " + field + ": " + raw);
  }
  return common::Result<std::int64_t>::success(parsed);
}

common::Status apply_json(DispatcherConfig &config, const std::string &json) {
  const auto parsed = common::json_parse_flat(json);
  if (!parsed.has_value()) {
    return config_error("config is not a valid JSON object");
  }
  const auto &values = *parsed;

  assign_string(values, "api_id", config.api_id);
  assign_string(values, "api_hash", config.api_hash);
  assign_string(values, "bot_token", config.bot_token);
  assign_optional_string(values, "message", config.message);
  assign_optional_string(values, "files_path", config.files_path);
  assign_string(values, "api_base_url", config.api_base_url);
  assign_string(values, "log_file", config.log_file);

  const std::pair<const char *, std::optional<std::int64_t> *> optional_ints[] = {
      {"chat_id", &config.chat_id},
      {"topic_id", &config.topic_id},
  };
  for (const auto &[field, target] : optional_ints) {
    if (auto status = assign_optional_int(values, field, *target); !status.ok()) {
      return status;
    }
  }

  const std::pair<const char *, std::int64_t *> ints[] = {
      {"max_files_per_group", &config.max_files_per_group},
      {"retry_attempts", &config.retry_attempts},
      {"retry_delay", &config.retry_delay},
      {"pacing_delay_ms", &config.pacing_delay_ms},
  };
  for (const auto &[field, target] : ints) {
    if (auto status = assign_int(values, field, *target); !status.ok()) {
      return status;
    }
  }

  const std::pair<const char *, bool *> flags[] = {
      {"dry_run", &config.dry_run},
      {"verbose", &config.verbose},
  };
  for (const auto &[field, target] : flags) {
    if (const auto it = values.find(field); it != values.end()) {
      if (auto status = parse_bool_field(it->second, field, *target); !status.ok()) {
        return status;
      }
    }
  }
  return common::Status::success();
}

common::Result<DispatcherConfig> load_config_file(const std::filesystem::path &path,
                                                  DispatcherConfig base) {
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<DispatcherConfig>::failure(
        common::ErrorKind::Configuration, "Failed to load config file: " + content.error());
  }

  if (auto status = apply_json(base, content.value()); !status.ok()) {
    return common::Result<DispatcherConfig>::failure(
        common::ErrorKind::Configuration,
        "Failed to load config file " + path.string() + ": " + status.error());
  }
  return common::Result<DispatcherConfig>::success(std::move(base));
}

std::string to_json(const DispatcherConfig &config) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"api_id\": " << quoted(config.api_id) << ",\n";
  out << "  \"api_hash\": " << quoted(config.api_hash) << ",\n";
  out << "  \"bot_token\": " << quoted(config.bot_token) << ",\n";
  out << "  \"chat_id\": " << optional_json(config.chat_id) << ",\n";
  out << "  \"message\": " << optional_json(config.message) << ",\n";
  out << "  \"topic_id\": " << optional_json(config.topic_id) << ",\n";
  out << "  \"files_path\": " << optional_json(config.files_path) << ",\n";
  out << "  \"max_files_per_group\": " << config.max_files_per_group << ",\n";
  out << "  \"retry_attempts\": " << config.retry_attempts << ",\n";
  out << "  \"retry_delay\": " << config.retry_delay << ",\n";
  out << "  \"pacing_delay_ms\": " << config.pacing_delay_ms << ",\n";
  out << "  \"api_base_url\": " << quoted(config.api_base_url) << ",\n";
  out << "  \"dry_run\": " << bool_json(config.dry_run) << ",\n";
  out << "  \"log_file\": " << quoted(config.log_file) << ",\n";
  out << "  \"verbose\": " << bool_json(config.verbose) << "\n";
  out << "}\n";
  return out.str();
}

common::Status save_config_file(const DispatcherConfig &config,
                                const std::filesystem::path &path) {
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return config_error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return config_error("Unable to write temporary config file: " + tmp_path.string());
  }
  file << to_json(config);
  file.close();
  if (!file) {
    return config_error("Failed writing temporary config file: " + tmp_path.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return config_error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Status apply_env_overrides(DispatcherConfig &config) {
  if (auto token = env_value("TELEDROP_BOT_TOKEN")) {
    config.bot_token = *token;
  } else if (auto legacy = env_value("BOT_TOKEN"); legacy && common::trim(config.bot_token).empty()) {
    config.bot_token = *legacy;
  }

  if (auto base_url = env_value("TELEDROP_API_BASE_URL")) {
    config.api_base_url = *base_url;
  }

  const auto apply_id = [](const char *primary, const char *legacy,
                           std::optional<std::int64_t> &target) -> common::Status {
    std::optional<std::string> raw = env_value(primary);
    std::string source = primary;
    if (!raw.has_value() && !target.has_value()) {
      raw = env_value(legacy);
      source = legacy;
    }
    if (!raw.has_value()) {
      return common::Status::success();
    }
    auto parsed = parse_int64(*raw, source);
    if (!parsed.ok()) {
      return parsed.status();
    }
    target = parsed.value();
    return common::Status::success();
  };

  if (auto status = apply_id("TELEDROP_CHAT_ID", "CHAT_ID", config.chat_id); !status.ok()) {
    return status;
  }
  return apply_id("TELEDROP_TOPIC_ID", "THREAD_ID", config.topic_id);
}

common::Result<std::vector<std::string>> validate_config(const DispatcherConfig &config) {
  using Warnings = std::vector<std::string>;
  std::vector<std::string> missing;
  if (common::trim(config.bot_token).empty()) {
    missing.emplace_back("bot_token");
  }
  if (!config.chat_id.has_value()) {
    missing.emplace_back("chat_id");
  }
  if (!config.message.has_value() || config.message->empty()) {
    missing.emplace_back("message");
  }
  if (!missing.empty()) {
    std::string joined;
    for (const auto &field : missing) {
      joined += joined.empty() ? field : ", " + field;
    }
    return common::Result<Warnings>::failure(common::ErrorKind::Configuration,
                                             "Missing required configuration: " + joined);
  }

  if (config.max_files_per_group < 1 ||
      config.max_files_per_group > static_cast<std::int64_t>(10)) {
    return common::Result<Warnings>::failure(common::ErrorKind::Configuration,
                                             "max_files_per_group must be between 1 and 10");
  }
  if (config.retry_attempts < 1 || config.retry_attempts > kMaxRetryAttempts) {
    return common::Result<Warnings>::failure(
        common::ErrorKind::Configuration,
        "retry_attempts must be between 1 and " + std::to_string(kMaxRetryAttempts));
  }
  if (config.retry_delay < 0 || config.retry_delay > kMaxRetryDelaySeconds) {
    return common::Result<Warnings>::failure(
        common::ErrorKind::Configuration,
        "retry_delay must be between 0 and " + std::to_string(kMaxRetryDelaySeconds) +
            " seconds");
  }
  if (config.pacing_delay_ms < 0 || config.pacing_delay_ms > kMaxPacingDelayMs) {
    return common::Result<Warnings>::failure(
        common::ErrorKind::Configuration,
        "pacing_delay_ms must be between 0 and " + std::to_string(kMaxPacingDelayMs));
  }
  if (common::trim(config.api_base_url).empty()) {
    return common::Result<Warnings>::failure(common::ErrorKind::Configuration,
                                             "api_base_url must not be empty");
  }
  if (config.files_path.has_value() && common::trim(*config.files_path).empty()) {
    return common::Result<Warnings>::failure(common::ErrorKind::Configuration,
                                             "files_path must not be empty when set");
  }

  Warnings warnings;
  if (!config.api_id.empty() || !config.api_hash.empty()) {
    warnings.emplace_back("api_id/api_hash are not used by the Bot API transport");
  }
  if (config.retry_attempts == 1) {
    warnings.emplace_back("retries are disabled (retry_attempts = 1)");
  }
  return common::Result<Warnings>::success(std::move(warnings));
}

dispatch::DispatchRequest to_request(const DispatcherConfig &config,
                                     std::vector<dispatch::FileRef> files) {
  dispatch::DispatchRequest request;
  request.message_text = config.message.value_or("");
  request.chat_id = config.chat_id.value_or(0);
  request.topic_id = config.topic_id;
  request.files = std::move(files);
  request.max_group_size = static_cast<std::size_t>(config.max_files_per_group);
  request.dry_run = config.dry_run;
  request.files_pattern = config.files_path;
  return request;
}

dispatch::RetryPolicy to_policy(const DispatcherConfig &config) {
  return dispatch::RetryPolicy{
      .max_attempts = static_cast<std::uint32_t>(config.retry_attempts),
      .delay_between_attempts = std::chrono::seconds(config.retry_delay)};
}

transport::Credentials to_credentials(const DispatcherConfig &config) {
  return transport::Credentials{.bot_token = config.bot_token,
                                .api_base_url = config.api_base_url,
                                .api_id = config.api_id,
                                .api_hash = config.api_hash};
}

} // namespace teledrop::config
