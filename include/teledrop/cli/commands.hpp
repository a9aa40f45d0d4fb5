#pragma once

#include "teledrop/common/result.hpp"
#include "teledrop/config/schema.hpp"
#include "teledrop/dispatch/cancellation.hpp"
#include "teledrop/observability/observer.hpp"
#include "teledrop/transport/transport.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace teledrop::cli {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitCancelled = 130;

/// Values given on the command line. Unset members leave the lower layers alone.
struct CliOverrides {
  std::optional<std::string> api_id;
  std::optional<std::string> api_hash;
  std::optional<std::string> bot_token;
  std::optional<std::string> chat_id;
  std::optional<std::string> message;
  std::optional<std::string> topic_id;
  std::optional<std::string> files;
  std::optional<std::string> max_files;
  std::optional<std::string> retry;
  std::optional<std::string> retry_delay;
  bool dry_run = false;
  bool verbose = false;
};

enum class CliAction {
  Run,
  Help,
  Version,
};

struct ParsedCommand {
  CliAction action = CliAction::Run;
  std::optional<std::string> config_path;
  std::optional<std::string> save_config_path;
  CliOverrides overrides;
  bool legacy_positional = false;
};

[[nodiscard]] std::string version_string();
void print_help(std::ostream &out);

/// Parses argv without the program name.
[[nodiscard]] common::Result<ParsedCommand> parse_arguments(std::vector<std::string> args);

[[nodiscard]] common::Status apply_overrides(config::DispatcherConfig &config,
                                             const CliOverrides &overrides);

/// Layers environment, config file and command line, in increasing precedence.
[[nodiscard]] common::Result<config::DispatcherConfig> resolve_config(const ParsedCommand &command);

/// Validates config, resolves files and runs one dispatch; returns the process exit code.
[[nodiscard]] int execute(const config::DispatcherConfig &config,
                          transport::TransportClient &client, dispatch::Waiter &waiter,
                          const dispatch::CancellationToken &token,
                          observability::IObserver &observer);

int run_cli(int argc, char **argv);

} // namespace teledrop::cli
