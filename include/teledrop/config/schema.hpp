#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace teledrop::config {

inline constexpr std::int64_t kMaxRetryAttempts = 100;
inline constexpr std::int64_t kMaxRetryDelaySeconds = 3600;
inline constexpr std::int64_t kMaxPacingDelayMs = 600000;

struct DispatcherConfig {
  std::string api_id;
  std::string api_hash;
  std::string bot_token;
  std::optional<std::int64_t> chat_id;
  std::optional<std::string> message;
  std::optional<std::int64_t> topic_id;
  std::optional<std::string> files_path;
  std::int64_t max_files_per_group = 10;
  std::int64_t retry_attempts = 3;
  // Seconds between attempts of one unit.
  std::int64_t retry_delay = 5;
  std::int64_t pacing_delay_ms = 1000;
  std::string api_base_url = "https://api.telegram.org";
  bool dry_run = false;
  std::string log_file = "teledrop.log";
  bool verbose = false;
};

} // namespace teledrop::config
