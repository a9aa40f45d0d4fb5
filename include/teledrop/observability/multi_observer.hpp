#pragma once

#include "teledrop/observability/observer.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace teledrop::observability {

/// Fans every event out to a set of log sinks. A sink that throws is dropped for
/// the rest of the run and the remaining sinks get a warning naming it, so a
/// broken log file never interrupts a dispatch.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] const std::vector<std::string> &dropped() const { return dropped_; }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "sinks"; }

private:
  using SinkCall = std::function<void(IObserver &)>;
  void for_each_sink(const SinkCall &call);

  std::vector<std::unique_ptr<IObserver>> observers_;
  std::vector<std::string> dropped_;
};

} // namespace teledrop::observability
