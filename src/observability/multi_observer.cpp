#include "teledrop/observability/multi_observer.hpp"

#include <exception>

namespace teledrop::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::for_each_sink(const SinkCall &call) {
  std::vector<std::string> failures;
  for (auto it = observers_.begin(); it != observers_.end();) {
    try {
      call(**it);
      ++it;
    } catch (const std::exception &ex) {
      const std::string sink((*it)->name());
      failures.push_back("Disabled " + sink + " log sink: " + ex.what());
      dropped_.push_back(sink);
      it = observers_.erase(it);
    }
  }

  // Each pass removes the sinks that failed, so this terminates.
  for (auto &message : failures) {
    const ObserverEvent warning =
        NoticeEvent{.level = LogLevel::Warning, .message = std::move(message)};
    for_each_sink([&warning](IObserver &sink) { sink.record_event(warning); });
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each_sink([&event](IObserver &sink) { sink.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each_sink([&metric](IObserver &sink) { sink.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each_sink([](IObserver &sink) { sink.flush(); });
}

} // namespace teledrop::observability
