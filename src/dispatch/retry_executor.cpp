#include "teledrop/dispatch/retry_executor.hpp"

#include <chrono>

namespace teledrop::dispatch {

namespace {

using OutcomeResult = common::Result<AttemptOutcome>;

OutcomeResult interrupted(const std::string &unit) {
  return OutcomeResult::failure(common::ErrorKind::Interrupted,
                                "cancelled before " + unit + " was delivered");
}

} // namespace

common::Status validate_policy(const RetryPolicy &policy) {
  if (policy.max_attempts == 0) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "retry policy needs at least one attempt");
  }
  if (policy.delay_between_attempts.count() < 0) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "retry delay must not be negative");
  }
  return common::Status::success();
}

RetryExecutor::RetryExecutor(Waiter &waiter, const CancellationToken &token,
                             observability::IObserver &observer)
    : waiter_(waiter), token_(token), observer_(observer) {}

OutcomeResult RetryExecutor::execute(const std::string &unit, const UnitOperation &operation,
                                     const RetryPolicy &policy) const {
  if (auto valid = validate_policy(policy); !valid.ok()) {
    return OutcomeResult::failure(valid);
  }
  if (!operation) {
    return OutcomeResult::failure(common::ErrorKind::Configuration,
                                  "no operation given for " + unit);
  }

  std::string last_error;
  for (std::uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if (token_.is_cancelled()) {
      return interrupted(unit);
    }

    const auto started = std::chrono::steady_clock::now();
    const auto status = operation();
    observer_.record_metric(observability::UnitLatencyMetric{
        .unit = unit,
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)});

    if (status.ok()) {
      observer_.record_event(observability::UnitSentEvent{.unit = unit, .attempt = attempt});
      return OutcomeResult::success(AttemptSucceeded{.attempts = attempt});
    }
    if (status.kind() == common::ErrorKind::Interrupted) {
      return interrupted(unit);
    }

    last_error = status.error();
    if (attempt == policy.max_attempts) {
      break;
    }

    observer_.record_event(observability::UnitRetryEvent{.unit = unit,
                                                         .attempt = attempt,
                                                         .max_attempts = policy.max_attempts,
                                                         .delay = policy.delay_between_attempts,
                                                         .error = last_error});
    if (!waiter_.wait_for(policy.delay_between_attempts, token_)) {
      return interrupted(unit);
    }
  }

  observer_.record_event(observability::UnitFailedEvent{
      .unit = unit, .attempts = policy.max_attempts, .error = last_error});
  return OutcomeResult::success(
      AttemptFailed{.last_error = last_error, .attempts_made = policy.max_attempts});
}

} // namespace teledrop::dispatch
