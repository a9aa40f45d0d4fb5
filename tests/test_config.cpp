#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "teledrop/config/config.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace {

void clear_env(std::vector<std::unique_ptr<teledrop::testing::EnvGuard>> &guards) {
  for (const char *key : {"TELEDROP_BOT_TOKEN", "TELEDROP_CHAT_ID", "TELEDROP_TOPIC_ID",
                          "TELEDROP_API_BASE_URL", "BOT_TOKEN", "CHAT_ID", "THREAD_ID"}) {
    guards.push_back(std::make_unique<teledrop::testing::EnvGuard>(key, std::nullopt));
  }
}

} // namespace

void register_config_tests(std::vector<teledrop::tests::TestCase> &tests) {
  using teledrop::tests::require;
  namespace cfg = teledrop::config;
  namespace cm = teledrop::common;
  namespace tt = teledrop::testing;

  tests.push_back({"config_defaults", [] {
                     const cfg::DispatcherConfig config;
                     require(config.max_files_per_group == 10, "default group size");
                     require(config.retry_attempts == 3, "default attempts");
                     require(config.retry_delay == 5, "default retry delay");
                     require(config.pacing_delay_ms == 1000, "default pacing");
                     require(config.api_base_url == "https://api.telegram.org", "default base url");
                     require(config.log_file == "teledrop.log", "default log file");
                     require(!config.dry_run && !config.verbose, "flags default off");
                   }});

  tests.push_back({"config_load_file_reads_known_keys", [] {
                     tt::TempWorkspace ws;
                     const auto path = ws.create_file("bot.json", R"({
  "api_id": 12345,
  "api_hash": "abc",
  "bot_token": "1:tok",
  "chat_id": -1009876,
  "message": "<b>Build</b> ready",
  "topic_id": "77",
  "files_path": "out/*.zip",
  "max_files_per_group": 4,
  "retry_attempts": 5,
  "retry_delay": 2,
  "dry_run": true,
  "unknown_key": "ignored"
})");
                     auto loaded = cfg::load_config_file(path);
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.api_id == "12345", "numeric api_id kept as text");
                     require(config.bot_token == "1:tok", "bot_token");
                     require(config.chat_id == std::optional<std::int64_t>(-1009876), "chat_id");
                     require(config.topic_id == std::optional<std::int64_t>(77),
                             "topic_id accepted as string");
                     require(config.message == std::optional<std::string>("<b>Build</b> ready"),
                             "message");
                     require(config.files_path == std::optional<std::string>("out/*.zip"),
                             "files_path");
                     require(config.max_files_per_group == 4, "max_files_per_group");
                     require(config.retry_attempts == 5 && config.retry_delay == 2, "retry");
                     require(config.dry_run, "dry_run");
                     require(config.pacing_delay_ms == 1000, "absent keys keep defaults");
                   }});

  tests.push_back({"config_load_file_errors", [] {
                     tt::TempWorkspace ws;
                     auto missing = cfg::load_config_file(ws.path() / "nope.json");
                     require(!missing.ok() && missing.kind() == cm::ErrorKind::Configuration,
                             "missing file is a configuration error");

                     const auto malformed = ws.create_file("bad.json", "{\"chat_id\": ");
                     require(!cfg::load_config_file(malformed).ok(), "malformed JSON rejected");

                     const auto bad_number = ws.create_file("num.json", R"({"chat_id": "abc"})");
                     auto invalid = cfg::load_config_file(bad_number);
                     require(!invalid.ok(), "non-numeric chat_id rejected");
                     require(invalid.error().find("chat_id") != std::string::npos,
                             "error should name the field");

                     const auto bad_bool = ws.create_file("bool.json", R"({"dry_run": "yes"})");
                     require(!cfg::load_config_file(bad_bool).ok(), "invalid boolean rejected");
                   }});

  tests.push_back({"config_load_file_layers_over_base", [] {
                     tt::TempWorkspace ws;
                     const auto path = ws.create_file("layer.json", R"({"chat_id": -42})");
                     cfg::DispatcherConfig base;
                     base.bot_token = "from-env";
                     base.chat_id = 1;
                     auto loaded = cfg::load_config_file(path, base);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().bot_token == "from-env", "base values kept");
                     require(loaded.value().chat_id == std::optional<std::int64_t>(-42),
                             "file values override the base");
                   }});

  tests.push_back({"config_save_then_load_preserves_values", [] {
                     tt::TempWorkspace ws;
                     auto config = tt::mock_config();
                     config.topic_id = 12;
                     config.files_path = "dist/\"quoted\".bin";
                     config.verbose = true;
                     const auto path = ws.path() / "nested" / "saved.json";

                     const auto saved = cfg::save_config_file(config, path);
                     require(saved.ok(), saved.error());
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temporary file should be renamed away");

                     auto loaded = cfg::load_config_file(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().chat_id == config.chat_id, "chat_id round trip");
                     require(loaded.value().topic_id == config.topic_id, "topic_id round trip");
                     require(loaded.value().files_path == config.files_path,
                             "escaped string round trip");
                     require(loaded.value().verbose, "bool round trip");
                   }});

  tests.push_back({"config_to_json_writes_null_for_unset_optionals", [] {
                     const cfg::DispatcherConfig config;
                     const auto json = cfg::to_json(config);
                     require(json.find("\"topic_id\": null") != std::string::npos,
                             "unset topic_id should be null");
                     require(json.find("\"max_files_per_group\": 10") != std::string::npos,
                             "numbers written bare");
                   }});

  tests.push_back({"config_env_overrides_and_legacy_fallbacks", [] {
                     std::vector<std::unique_ptr<tt::EnvGuard>> guards;
                     clear_env(guards);
                     tt::EnvGuard token("TELEDROP_BOT_TOKEN", std::string("env-token"));
                     tt::EnvGuard legacy_chat("CHAT_ID", std::string("-42"));
                     tt::EnvGuard legacy_thread("THREAD_ID", std::string("9"));

                     cfg::DispatcherConfig config;
                     config.bot_token = "file-token";
                     config.topic_id = 3;
                     const auto status = cfg::apply_env_overrides(config);
                     require(status.ok(), status.error());
                     require(config.bot_token == "env-token", "TELEDROP_* should override");
                     require(config.chat_id == std::optional<std::int64_t>(-42),
                             "legacy variable fills an unset field");
                     require(config.topic_id == std::optional<std::int64_t>(3),
                             "legacy variable must not replace a set field");
                   }});

  tests.push_back({"config_env_invalid_number_is_an_error", [] {
                     std::vector<std::unique_ptr<tt::EnvGuard>> guards;
                     clear_env(guards);
                     tt::EnvGuard chat("TELEDROP_CHAT_ID", std::string("twelve"));
                     cfg::DispatcherConfig config;
                     const auto status = cfg::apply_env_overrides(config);
                     require(!status.ok() && status.kind() == cm::ErrorKind::Configuration,
                             "invalid env number should fail");
                   }});

  tests.push_back({"config_validate_requires_core_fields", [] {
                     cfg::DispatcherConfig config;
                     auto result = cfg::validate_config(config);
                     require(!result.ok(), "empty config must fail");
                     require(result.error().find("bot_token") != std::string::npos &&
                                 result.error().find("chat_id") != std::string::npos &&
                                 result.error().find("message") != std::string::npos,
                             "error should list every missing field");

                     auto ok = cfg::validate_config(tt::mock_config());
                     require(ok.ok(), ok.error());
                     require(ok.value().empty(), "complete config has no warnings");
                   }});

  tests.push_back({"config_validate_ranges", [] {
                     auto config = tt::mock_config();
                     config.max_files_per_group = 0;
                     require(!cfg::validate_config(config).ok(), "group size 0 rejected");
                     config.max_files_per_group = 11;
                     require(!cfg::validate_config(config).ok(), "group size 11 rejected");
                     config.max_files_per_group = 10;
                     config.retry_attempts = 0;
                     require(!cfg::validate_config(config).ok(), "zero attempts rejected");
                     config.retry_attempts = 3;
                     config.retry_delay = -1;
                     require(!cfg::validate_config(config).ok(), "negative delay rejected");
                     config.retry_delay = 0;
                     config.pacing_delay_ms = -5;
                     require(!cfg::validate_config(config).ok(), "negative pacing rejected");
                   }});

  tests.push_back({"config_validate_upper_bounds", [] {
                     auto config = tt::mock_config();
                     config.retry_attempts = 4294967297;
                     auto attempts = cfg::validate_config(config);
                     require(!attempts.ok(), "attempts beyond 32 bits rejected, not truncated");
                     require(attempts.error().find("retry_attempts") != std::string::npos,
                             attempts.error());
                     config.retry_attempts = cfg::kMaxRetryAttempts + 1;
                     require(!cfg::validate_config(config).ok(), "attempts above cap rejected");
                     config.retry_attempts = cfg::kMaxRetryAttempts;
                     require(cfg::validate_config(config).ok(), "attempts at cap accepted");

                     config.retry_delay = 10000000000000;
                     require(!cfg::validate_config(config).ok(), "huge retry delay rejected");
                     config.retry_delay = cfg::kMaxRetryDelaySeconds;
                     require(cfg::validate_config(config).ok(), "delay at cap accepted");

                     config.pacing_delay_ms = cfg::kMaxPacingDelayMs + 1;
                     require(!cfg::validate_config(config).ok(), "pacing above cap rejected");
                   }});

  tests.push_back({"config_json_out_of_range_values_fail_validation", [] {
                     cfg::DispatcherConfig config = tt::mock_config();
                     const auto applied =
                         cfg::apply_json(config, R"({"retry_attempts": 4294967297, "retry_delay": 5})");
                     require(applied.ok(), applied.error());
                     require(!cfg::validate_config(config).ok(),
                             "oversized attempts from a config file are rejected");
                   }});

  tests.push_back({"config_validate_warns_about_unused_api_credentials", [] {
                     auto config = tt::mock_config();
                     config.api_id = "12345";
                     auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "expected one warning");
                     require(result.value()[0].find("api_id") != std::string::npos,
                             "warning should mention api_id");
                   }});

  tests.push_back({"config_builds_request_policy_and_credentials", [] {
                     auto config = tt::mock_config();
                     config.topic_id = 5;
                     config.files_path = "*.log";
                     config.max_files_per_group = 3;
                     config.retry_attempts = 4;
                     config.retry_delay = 2;
                     config.dry_run = true;
                     config.api_base_url = "http://localhost:8081";

                     const auto request = cfg::to_request(config, {"a.log", "b.log"});
                     require(request.message_text == "Build finished", "message text");
                     require(request.chat_id == -1001234567890, "chat id");
                     require(request.topic_id == std::optional<std::int64_t>(5), "topic id");
                     require(request.files.size() == 2, "files");
                     require(request.max_group_size == 3, "group size");
                     require(request.dry_run, "dry run");
                     require(request.files_pattern == std::optional<std::string>("*.log"),
                             "pattern");

                     const auto policy = cfg::to_policy(config);
                     require(policy.max_attempts == 4, "attempts");
                     require(policy.delay_between_attempts == std::chrono::seconds(2),
                             "delay converted from seconds");

                     const auto credentials = cfg::to_credentials(config);
                     require(credentials.bot_token == config.bot_token, "token");
                     require(credentials.api_base_url == "http://localhost:8081", "base url");
                   }});

  tests.push_back({"config_parse_int64", [] {
                     require(cfg::parse_int64(" -100 ", "x").value() == -100, "trimmed negative");
                     require(!cfg::parse_int64("12abc", "x").ok(), "trailing junk rejected");
                     require(!cfg::parse_int64("", "x").ok(), "empty rejected");
                     require(!cfg::parse_int64("99999999999999999999", "x").ok(),
                             "overflow rejected");
                   }});
}
