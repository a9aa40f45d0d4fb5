#include "teledrop/observability/log_observer.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace teledrop::observability {

namespace {

constexpr const char *RESET = "\033[0m";

const char *level_color(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "\033[94m";
  case LogLevel::Info:
    return "\033[92m";
  case LogLevel::Warning:
    return "\033[93m";
  case LogLevel::Error:
    return "\033[91m";
  }
  return RESET;
}

std::string timestamp_now() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

} // namespace

LogObserver::LogObserver(std::ostream &out, const LogOptions options)
    : out_(out), options_(options) {}

void LogObserver::write_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(options_.min_level)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (options_.color) {
    out_ << level_color(level);
  }
  out_ << timestamp_now() << " - " << level_name(level) << " - " << message;
  if (options_.color) {
    out_ << RESET;
  }
  out_ << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  write_line(event_level(event), format_event(event));
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, UnitLatencyMetric>) {
          write_line(LogLevel::Debug, "metric.unit_latency_ms unit=\"" + m.unit +
                                          "\" value=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, RunElapsedMetric>) {
          write_line(LogLevel::Debug,
                     "metric.run_elapsed_ms value=" + std::to_string(m.elapsed.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

FileLogObserver::FileLogObserver(const std::filesystem::path &path, const LogLevel min_level)
    : file_(path, std::ios::app), sink_(file_, {.min_level = min_level, .color = false}) {}

void FileLogObserver::record_event(const ObserverEvent &event) {
  if (file_.is_open()) {
    sink_.record_event(event);
  }
}

void FileLogObserver::record_metric(const ObserverMetric &metric) {
  if (file_.is_open()) {
    sink_.record_metric(metric);
  }
}

void FileLogObserver::flush() {
  if (file_.is_open()) {
    sink_.flush();
  }
}

} // namespace teledrop::observability
