#include "teledrop/cli/commands.hpp"

#include "teledrop/common/fs.hpp"
#include "teledrop/config/config.hpp"
#include "teledrop/dispatch/engine.hpp"
#include "teledrop/observability/factory.hpp"
#include "teledrop/transport/http_client.hpp"
#include "teledrop/transport/telegram.hpp"
#include "teledrop/version.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <unistd.h>

namespace teledrop::cli {

namespace {

using ParseResult = common::Result<ParsedCommand>;

constexpr std::size_t kLegacyMinPositionals = 5;
constexpr std::size_t kLegacyMaxPositionals = 7;

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Splits "--name=value" into two tokens so every option can be taken the same way.
std::vector<std::string> split_inline_values(const std::vector<std::string> &args) {
  std::vector<std::string> out;
  out.reserve(args.size());
  for (const auto &arg : args) {
    const auto eq = arg.find('=');
    if (common::starts_with(arg, "--") && eq != std::string::npos) {
      out.push_back(arg.substr(0, eq));
      out.push_back(arg.substr(eq + 1));
    } else {
      out.push_back(arg);
    }
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::optional<std::string> &out_value,
                 std::string &error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + long_name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name,
               const std::string &short_name = "") {
  bool found = false;
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
      args.erase(args.begin() + static_cast<long>(i));
      found = true;
      continue;
    }
    ++i;
  }
  return found;
}

// Negative numbers are values (chat IDs of groups), not options.
bool looks_like_option(const std::string &arg) {
  if (arg.size() < 2 || arg[0] != '-') {
    return false;
  }
  return std::isdigit(static_cast<unsigned char>(arg[1])) == 0;
}

void apply_legacy_positionals(const std::vector<std::string> &positionals,
                              CliOverrides &overrides) {
  overrides.api_id = positionals[0];
  overrides.api_hash = positionals[1];
  overrides.bot_token = positionals[2];
  overrides.message = positionals[3];
  overrides.chat_id = positionals[4];
  if (positionals.size() <= 5) {
    return;
  }
  if (config::parse_int64(positionals[5], "topic_id").ok()) {
    overrides.topic_id = positionals[5];
    if (positionals.size() > 6) {
      overrides.files = positionals[6];
    }
  } else {
    overrides.files = positionals[5];
  }
}

common::Status assign_int(const std::optional<std::string> &raw, const std::string &field,
                          std::int64_t &target) {
  if (!raw.has_value()) {
    return common::Status::success();
  }
  auto parsed = config::parse_int64(*raw, field);
  if (!parsed.ok()) {
    return parsed.status();
  }
  target = parsed.value();
  return common::Status::success();
}

common::Status assign_optional_int(const std::optional<std::string> &raw,
                                   const std::string &field,
                                   std::optional<std::int64_t> &target) {
  if (!raw.has_value()) {
    return common::Status::success();
  }
  auto parsed = config::parse_int64(*raw, field);
  if (!parsed.ok()) {
    return parsed.status();
  }
  target = parsed.value();
  return common::Status::success();
}

std::string seconds_text(const std::chrono::steady_clock::duration elapsed) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << std::chrono::duration<double>(elapsed).count();
  return out.str();
}

std::atomic<dispatch::CancellationToken *> g_signal_token{nullptr};

void handle_stop_signal(int /*signal*/) {
  if (auto *token = g_signal_token.load(); token != nullptr) {
    token->cancel_from_signal();
  }
}

// Routes SIGINT and SIGTERM to a token for the lifetime of the scope.
class SignalScope {
public:
  explicit SignalScope(dispatch::CancellationToken &token) {
    g_signal_token.store(&token);
    previous_int_ = std::signal(SIGINT, handle_stop_signal);
    previous_term_ = std::signal(SIGTERM, handle_stop_signal);
  }

  ~SignalScope() {
    std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
    std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
    g_signal_token.store(nullptr);
  }

  SignalScope(const SignalScope &) = delete;
  SignalScope &operator=(const SignalScope &) = delete;

private:
  void (*previous_int_)(int) = SIG_DFL;
  void (*previous_term_)(int) = SIG_DFL;
};

} // namespace

std::string version_string() { return std::string("teledrop ") + TELEDROP_VERSION; }

void print_help(std::ostream &out) {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  const auto option = [&](const char *flags, const char *description) {
    out << "  " << GREEN << std::left << std::setw(26) << flags << RESET << DIM << description
        << RESET << "\n";
  };

  out << "\n";
  out << BOLD << "  teledrop" << RESET << DIM << " - send a message and files to a Telegram chat"
      << RESET << "\n";
  out << DIM << "  " << version_string() << RESET << "\n\n";

  out << BOLD << "  USAGE" << RESET << "\n";
  out << DIM << "  $ " << RESET << "teledrop [options]\n";
  out << DIM << "  $ " << RESET
      << "teledrop API_ID API_HASH BOT_TOKEN MESSAGE CHAT_ID [TOPIC_ID|FILES] [FILES]\n\n";

  out << BOLD << "  CONFIGURATION" << RESET << "\n";
  option("-c, --config FILE", "Load settings from a JSON config file");
  option("--save-config FILE", "Save the effective settings to a JSON file");
  option("--api-id ID", "Telegram API ID (accepted, unused by the Bot API)");
  option("--api-hash HASH", "Telegram API hash (accepted, unused by the Bot API)");
  option("--bot-token TOKEN", "Bot token (env: TELEDROP_BOT_TOKEN, BOT_TOKEN)");
  option("--chat-id ID", "Destination chat (env: TELEDROP_CHAT_ID, CHAT_ID)");
  option("--topic-id ID", "Forum topic (env: TELEDROP_TOPIC_ID, THREAD_ID)");
  out << "\n";

  out << BOLD << "  CONTENT" << RESET << "\n";
  option("-m, --message TEXT", "Message text or caption (HTML)");
  option("--files PATTERN", "Path or glob pattern of files to send");
  option("--max-files N", "Files per group, 1-10 (default 10)");
  out << "\n";

  out << BOLD << "  DELIVERY" << RESET << "\n";
  option("--retry N", "Attempts per unit (default 3)");
  option("--retry-delay SECONDS", "Pause between attempts (default 5)");
  option("--dry-run", "Log what would be sent without sending");
  option("-v, --verbose", "Enable debug logging");
  option("-h, --help", "Show this help");
  option("-V, --version", "Show version");
  out << "\n";
}

common::Result<ParsedCommand> parse_arguments(std::vector<std::string> raw_args) {
  std::vector<std::string> args = split_inline_values(raw_args);
  ParsedCommand command;
  CliOverrides &overrides = command.overrides;

  struct OptionSpec {
    const char *long_name;
    const char *short_name;
    std::optional<std::string> *target;
  };
  const OptionSpec specs[] = {
      {"--config", "-c", &command.config_path},
      {"--save-config", "", &command.save_config_path},
      {"--api-id", "", &overrides.api_id},
      {"--api-hash", "", &overrides.api_hash},
      {"--bot-token", "", &overrides.bot_token},
      {"--chat-id", "", &overrides.chat_id},
      {"--message", "-m", &overrides.message},
      {"--topic-id", "", &overrides.topic_id},
      {"--files", "", &overrides.files},
      {"--max-files", "", &overrides.max_files},
      {"--retry", "", &overrides.retry},
      {"--retry-delay", "", &overrides.retry_delay},
  };
  for (const auto &spec : specs) {
    std::string error;
    if (!take_option(args, spec.long_name, spec.short_name, *spec.target, error) &&
        !error.empty()) {
      return ParseResult::failure(common::ErrorKind::Configuration, error);
    }
  }

  // Flags come after the options so a value such as "-m -v" stays a value.
  if (take_flag(args, "--help", "-h")) {
    command.action = CliAction::Help;
    return ParseResult::success(std::move(command));
  }
  if (take_flag(args, "--version", "-V")) {
    command.action = CliAction::Version;
    return ParseResult::success(std::move(command));
  }
  overrides.dry_run = take_flag(args, "--dry-run");
  overrides.verbose = take_flag(args, "--verbose", "-v");

  for (const auto &arg : args) {
    if (looks_like_option(arg)) {
      return ParseResult::failure(common::ErrorKind::Configuration, "unknown option: " + arg);
    }
  }

  if (args.empty()) {
    return ParseResult::success(std::move(command));
  }
  if (args.size() < kLegacyMinPositionals || args.size() > kLegacyMaxPositionals) {
    return ParseResult::failure(common::ErrorKind::Configuration,
                                "unexpected positional arguments; expected none or "
                                "API_ID API_HASH BOT_TOKEN MESSAGE CHAT_ID [TOPIC_ID|FILES] "
                                "[FILES]");
  }
  command.legacy_positional = true;
  apply_legacy_positionals(args, overrides);
  return ParseResult::success(std::move(command));
}

common::Status apply_overrides(config::DispatcherConfig &config, const CliOverrides &overrides) {
  if (overrides.api_id.has_value()) {
    config.api_id = *overrides.api_id;
  }
  if (overrides.api_hash.has_value()) {
    config.api_hash = *overrides.api_hash;
  }
  if (overrides.bot_token.has_value()) {
    config.bot_token = *overrides.bot_token;
  }
  if (overrides.message.has_value()) {
    config.message = *overrides.message;
  }
  if (overrides.files.has_value()) {
    config.files_path = *overrides.files;
  }
  if (auto status = assign_optional_int(overrides.chat_id, "chat_id", config.chat_id);
      !status.ok()) {
    return status;
  }
  if (auto status = assign_optional_int(overrides.topic_id, "topic_id", config.topic_id);
      !status.ok()) {
    return status;
  }
  if (auto status = assign_int(overrides.max_files, "max_files", config.max_files_per_group);
      !status.ok()) {
    return status;
  }
  if (auto status = assign_int(overrides.retry, "retry", config.retry_attempts); !status.ok()) {
    return status;
  }
  if (auto status = assign_int(overrides.retry_delay, "retry_delay", config.retry_delay);
      !status.ok()) {
    return status;
  }
  if (overrides.dry_run) {
    config.dry_run = true;
  }
  if (overrides.verbose) {
    config.verbose = true;
  }
  return common::Status::success();
}

common::Result<config::DispatcherConfig> resolve_config(const ParsedCommand &command) {
  using ConfigResult = common::Result<config::DispatcherConfig>;
  config::DispatcherConfig config;

  if (auto status = config::apply_env_overrides(config); !status.ok()) {
    return ConfigResult::failure(status);
  }

  if (command.config_path.has_value()) {
    auto loaded =
        config::load_config_file(common::expand_path(*command.config_path), std::move(config));
    if (!loaded.ok()) {
      return loaded;
    }
    config = std::move(loaded.value());
  }

  if (auto status = apply_overrides(config, command.overrides); !status.ok()) {
    return ConfigResult::failure(status);
  }
  return ConfigResult::success(std::move(config));
}

int execute(const config::DispatcherConfig &config, transport::TransportClient &client,
            dispatch::Waiter &waiter, const dispatch::CancellationToken &token,
            observability::IObserver &observer) {
  const auto started = std::chrono::steady_clock::now();

  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    observer.error("config", validated.error());
    observer.flush();
    return kExitFailure;
  }
  for (const auto &warning : validated.value()) {
    observer.notice(observability::LogLevel::Warning, warning);
  }

  std::vector<dispatch::FileRef> files;
  if (config.files_path.has_value()) {
    auto resolved = common::resolve_files(*config.files_path);
    if (!resolved.ok()) {
      observer.error("files", resolved.error());
      observer.flush();
      return kExitFailure;
    }
    files = std::move(resolved.value());
    observer.notice(observability::LogLevel::Debug,
                    "Resolved " + std::to_string(files.size()) + " file(s) from " +
                        *config.files_path);
  }

  const dispatch::DispatchEngine engine(
      observer, waiter, token,
      dispatch::EngineOptions{.pacing_delay = std::chrono::milliseconds(config.pacing_delay_ms)});
  auto report = engine.run(config::to_request(config, std::move(files)), client,
                           config::to_credentials(config), config::to_policy(config));
  if (!report.ok()) {
    // Session failures are already reported by the engine.
    if (report.kind() != common::ErrorKind::Session) {
      observer.error("dispatch", report.error());
    }
    observer.flush();
    return kExitFailure;
  }

  if (report.value().state == dispatch::RunState::Cancelled) {
    observer.flush();
    return kExitCancelled;
  }

  observer.notice(observability::LogLevel::Info,
                  "Operation completed in " +
                      seconds_text(std::chrono::steady_clock::now() - started) + " seconds");
  observer.flush();
  return report.value().all_succeeded() ? kExitSuccess : kExitFailure;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  auto parsed = parse_arguments(std::move(args));
  if (!parsed.ok()) {
    std::cerr << parsed.error() << "\n";
    std::cerr << "Run 'teledrop --help' for usage.\n";
    return kExitFailure;
  }
  const ParsedCommand &command = parsed.value();
  if (command.action == CliAction::Help) {
    print_help(std::cout);
    return kExitSuccess;
  }
  if (command.action == CliAction::Version) {
    std::cout << version_string() << "\n";
    return kExitSuccess;
  }

  auto resolved = resolve_config(command);
  if (!resolved.ok()) {
    std::cerr << resolved.error() << "\n";
    return kExitFailure;
  }
  const config::DispatcherConfig &config = resolved.value();

  const auto observer =
      observability::create_observer(config, std::cerr, isatty(STDERR_FILENO) == 1);
  if (command.legacy_positional) {
    observer->notice(observability::LogLevel::Warning,
                     "Using legacy positional arguments. Consider switching to named arguments.");
  }

  if (command.save_config_path.has_value()) {
    if (!config::validate_config(config).ok()) {
      observer->notice(observability::LogLevel::Warning,
                       "Not saving incomplete configuration to " + *command.save_config_path);
    } else if (auto saved = config::save_config_file(
                   config, common::expand_path(*command.save_config_path));
               !saved.ok()) {
      observer->error("config", "Failed to save config file: " + saved.error());
    } else {
      observer->notice(observability::LogLevel::Info,
                       "Configuration saved to " + *command.save_config_path);
    }
  }

  dispatch::CancellationToken token;
  const SignalScope signals(token);
  dispatch::SteadyWaiter waiter;
  transport::TelegramBotClient client(std::make_shared<transport::CurlHttpClient>(
      [&token]() { return token.is_cancelled(); }));
  return execute(config, client, waiter, token, *observer);
}

} // namespace teledrop::cli
