#include "teledrop/observability/observer.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace teledrop::observability {

namespace {

std::string seconds_text(const std::chrono::milliseconds duration) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << static_cast<double>(duration.count()) / 1000.0;
  return out.str();
}

} // namespace

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogLevel event_level(const ObserverEvent &event) {
  return std::visit(
      [](auto &&evt) -> LogLevel {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, UnitRetryEvent>) {
          return LogLevel::Warning;
        } else if constexpr (std::is_same_v<T, UnitFailedEvent> || std::is_same_v<T, ErrorEvent>) {
          return LogLevel::Error;
        } else if constexpr (std::is_same_v<T, SessionClosedEvent>) {
          return evt.clean ? LogLevel::Info : LogLevel::Warning;
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          return evt.failed == 0 ? LogLevel::Info : LogLevel::Warning;
        } else if constexpr (std::is_same_v<T, NoticeEvent>) {
          return evt.level;
        } else {
          return LogLevel::Info;
        }
      },
      event);
}

std::string format_event(const ObserverEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RunStartEvent>) {
          return std::string(evt.dry_run ? "DRY RUN: " : "") + "dispatching " +
                 std::to_string(evt.planned_units) + " unit(s) to chat ID " +
                 std::to_string(evt.chat_id);
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          return "run " + evt.state + ": " + std::to_string(evt.succeeded) + " succeeded, " +
                 std::to_string(evt.failed) + " failed in " + seconds_text(evt.elapsed) +
                 " seconds";
        } else if constexpr (std::is_same_v<T, SessionOpenedEvent>) {
          return "Bot is active! Logged in as @" + evt.bot_username;
        } else if constexpr (std::is_same_v<T, SessionClosedEvent>) {
          if (evt.clean) {
            return "Bot has been deactivated";
          }
          return "session teardown failed: " + evt.error;
        } else if constexpr (std::is_same_v<T, UnitSentEvent>) {
          return evt.unit + " sent successfully (attempt " + std::to_string(evt.attempt) + ")";
        } else if constexpr (std::is_same_v<T, UnitRetryEvent>) {
          return "Attempt " + std::to_string(evt.attempt) + "/" +
                 std::to_string(evt.max_attempts) + " for " + evt.unit + " failed: " + evt.error +
                 ". Retrying in " + seconds_text(evt.delay) + " seconds...";
        } else if constexpr (std::is_same_v<T, UnitFailedEvent>) {
          return "Failed to send " + evt.unit + " after " + std::to_string(evt.attempts) +
                 " attempt(s): " + evt.error;
        } else if constexpr (std::is_same_v<T, DryRunUnitEvent>) {
          return "DRY RUN: would send " + evt.unit + ": " + evt.detail;
        } else if constexpr (std::is_same_v<T, NoticeEvent>) {
          return evt.message;
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          return evt.component + ": " + evt.message;
        }
      },
      event);
}

} // namespace teledrop::observability
