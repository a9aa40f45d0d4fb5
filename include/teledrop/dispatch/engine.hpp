#pragma once

#include "teledrop/common/result.hpp"
#include "teledrop/dispatch/cancellation.hpp"
#include "teledrop/dispatch/types.hpp"
#include "teledrop/observability/observer.hpp"
#include "teledrop/transport/transport.hpp"

#include <chrono>
#include <string>

namespace teledrop::dispatch {

struct EngineOptions {
  // Pause between consecutive file groups to stay under the endpoint's rate limiter.
  std::chrono::milliseconds pacing_delay{1000};
};

/// "<message>\n\n(Group i/total)", or just the suffix for an empty message.
[[nodiscard]] std::string format_group_caption(const std::string &message,
                                               const FileGroup &group);

/// Drives one dispatch run: plans units, opens the transport session, sends every unit
/// through a RetryExecutor in order and always tears the session down again.
///
/// Errors:
///   - ErrorKind::Configuration for an invalid policy or request, before any remote call.
///   - ErrorKind::Session when the transport session cannot be opened (run aborted).
/// Failed units and cancellation are reported in the DispatchReport instead.
class DispatchEngine {
public:
  DispatchEngine(observability::IObserver &observer, Waiter &waiter,
                 const CancellationToken &token, EngineOptions options = {});

  [[nodiscard]] common::Result<DispatchReport> run(const DispatchRequest &request,
                                                   transport::TransportClient &client,
                                                   const transport::Credentials &credentials,
                                                   const RetryPolicy &policy) const;

private:
  [[nodiscard]] DispatchReport simulate(const DispatchRequest &request,
                                        const std::vector<FileGroup> &groups) const;

  observability::IObserver &observer_;
  Waiter &waiter_;
  const CancellationToken &token_;
  EngineOptions options_;
};

} // namespace teledrop::dispatch
