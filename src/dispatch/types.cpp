#include "teledrop/dispatch/types.hpp"

#include <algorithm>

namespace teledrop::dispatch {

std::string_view run_state_name(const RunState state) {
  switch (state) {
  case RunState::Completed:
    return "completed";
  case RunState::Cancelled:
    return "cancelled";
  }
  return "completed";
}

std::size_t DispatchReport::failed_count() const {
  return static_cast<std::size_t>(
      std::count_if(unit_results.begin(), unit_results.end(),
                    [](const UnitResult &unit) { return !succeeded(unit.outcome); }));
}

bool DispatchReport::all_succeeded() const {
  return state == RunState::Completed && failed_count() == 0 &&
         unit_results.size() == planned_units;
}

} // namespace teledrop::dispatch
