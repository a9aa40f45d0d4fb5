#pragma once

#include "teledrop/config/schema.hpp"
#include "teledrop/observability/observer.hpp"

#include <memory>
#include <ostream>

namespace teledrop::observability {

/// Console logging at INFO (DEBUG when verbose), plus an appending log file when
/// config.log_file is set.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::DispatcherConfig &config,
                                                         std::ostream &console,
                                                         bool color = true);

} // namespace teledrop::observability
