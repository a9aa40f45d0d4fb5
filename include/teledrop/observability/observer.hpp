#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace teledrop::observability {

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
};

[[nodiscard]] std::string_view level_name(LogLevel level);

struct RunStartEvent {
  std::int64_t chat_id = 0;
  std::size_t planned_units = 0;
  bool dry_run = false;
};

struct RunEndEvent {
  std::string state;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::chrono::milliseconds elapsed{0};
};

struct SessionOpenedEvent {
  std::string bot_username;
};

struct SessionClosedEvent {
  bool clean = true;
  std::string error;
};

struct UnitSentEvent {
  std::string unit;
  std::uint32_t attempt = 1;
};

struct UnitRetryEvent {
  std::string unit;
  std::uint32_t attempt = 0;
  std::uint32_t max_attempts = 0;
  std::chrono::milliseconds delay{0};
  std::string error;
};

struct UnitFailedEvent {
  std::string unit;
  std::uint32_t attempts = 0;
  std::string error;
};

struct DryRunUnitEvent {
  std::string unit;
  std::string detail;
};

struct NoticeEvent {
  LogLevel level = LogLevel::Info;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<RunStartEvent, RunEndEvent, SessionOpenedEvent, SessionClosedEvent,
                 UnitSentEvent, UnitRetryEvent, UnitFailedEvent, DryRunUnitEvent, NoticeEvent,
                 ErrorEvent>;

struct UnitLatencyMetric {
  std::string unit;
  std::chrono::milliseconds latency{0};
};

struct RunElapsedMetric {
  std::chrono::milliseconds elapsed{0};
};

using ObserverMetric = std::variant<UnitLatencyMetric, RunElapsedMetric>;

[[nodiscard]] LogLevel event_level(const ObserverEvent &event);
[[nodiscard]] std::string format_event(const ObserverEvent &event);

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;

  void notice(LogLevel level, std::string message) {
    record_event(NoticeEvent{.level = level, .message = std::move(message)});
  }
  void error(std::string component, std::string message) {
    record_event(ErrorEvent{.component = std::move(component), .message = std::move(message)});
  }
};

} // namespace teledrop::observability
