#pragma once

#include "teledrop/observability/observer.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>

namespace teledrop::observability {

struct LogOptions {
  LogLevel min_level = LogLevel::Info;
  bool color = false;
};

/// Writes one timestamped line per event to a caller-owned stream.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out, LogOptions options = {});

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write_line(LogLevel level, const std::string &message);

  std::ostream &out_;
  LogOptions options_;
  std::mutex mutex_;
};

/// Appends uncoloured log lines to a file.
class FileLogObserver final : public IObserver {
public:
  FileLogObserver(const std::filesystem::path &path, LogLevel min_level);

  [[nodiscard]] bool is_open() const { return file_.is_open(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "file"; }

private:
  std::ofstream file_;
  LogObserver sink_;
};

} // namespace teledrop::observability
