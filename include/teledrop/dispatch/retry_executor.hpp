#pragma once

#include "teledrop/common/result.hpp"
#include "teledrop/dispatch/cancellation.hpp"
#include "teledrop/dispatch/types.hpp"
#include "teledrop/observability/observer.hpp"

#include <functional>
#include <string>

namespace teledrop::dispatch {

using UnitOperation = std::function<common::Status()>;

[[nodiscard]] common::Status validate_policy(const RetryPolicy &policy);

/// Runs one unit of work sequentially until it succeeds or the policy's attempt budget is
/// spent. Transport failures become an AttemptFailed outcome; an invalid policy fails with
/// ErrorKind::Configuration and a cancelled retry wait with ErrorKind::Interrupted.
class RetryExecutor {
public:
  RetryExecutor(Waiter &waiter, const CancellationToken &token,
                observability::IObserver &observer);

  [[nodiscard]] common::Result<AttemptOutcome>
  execute(const std::string &unit, const UnitOperation &operation,
          const RetryPolicy &policy) const;

private:
  Waiter &waiter_;
  const CancellationToken &token_;
  observability::IObserver &observer_;
};

} // namespace teledrop::dispatch
