#include "teledrop/observability/factory.hpp"

#include "teledrop/common/fs.hpp"
#include "teledrop/observability/log_observer.hpp"
#include "teledrop/observability/multi_observer.hpp"

namespace teledrop::observability {

std::unique_ptr<IObserver> create_observer(const config::DispatcherConfig &config,
                                           std::ostream &console, const bool color) {
  const LogLevel level = config.verbose ? LogLevel::Debug : LogLevel::Info;

  auto multi = std::make_unique<MultiObserver>();
  multi->add(std::make_unique<LogObserver>(console, LogOptions{.min_level = level, .color = color}));

  const std::string log_file = common::trim(config.log_file);
  if (log_file.empty()) {
    return multi;
  }

  auto file = std::make_unique<FileLogObserver>(common::expand_path(log_file), level);
  if (!file->is_open()) {
    multi->notice(LogLevel::Warning, "Unable to open log file " + log_file +
                                         "; logging to console only");
    return multi;
  }
  multi->add(std::move(file));
  return multi;
}

} // namespace teledrop::observability
