#include "teledrop/dispatch/engine.hpp"

#include "teledrop/dispatch/batch_planner.hpp"
#include "teledrop/dispatch/retry_executor.hpp"

#include <exception>
#include <sstream>

namespace teledrop::dispatch {

namespace {

using ReportResult = common::Result<DispatchReport>;

constexpr std::size_t kPreviewChars = 50;
constexpr std::size_t kPreviewFiles = 5;

std::string group_label(const FileGroup &group) {
  return "file group " + std::to_string(group.index) + "/" + std::to_string(group.total);
}

std::string message_preview(const std::string &text) {
  if (text.size() <= kPreviewChars) {
    return text;
  }
  return text.substr(0, kPreviewChars) + "...";
}

std::string file_preview(const FileGroup &group) {
  std::ostringstream out;
  out << group.items.size() << " file(s): ";
  for (std::size_t i = 0; i < group.items.size() && i < kPreviewFiles; ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << group.items[i].filename().string();
  }
  if (group.items.size() > kPreviewFiles) {
    out << "...";
  }
  return out.str();
}

// Releases the transport session on every exit path out of a run.
class SessionGuard {
public:
  SessionGuard(transport::TransportClient &client, transport::Session session,
               observability::IObserver &observer)
      : client_(client), session_(std::move(session)), observer_(observer) {}

  ~SessionGuard() {
    const auto closed = client_.close(session_);
    try {
      observer_.record_event(
          observability::SessionClosedEvent{.clean = closed.ok(), .error = closed.error()});
    } catch (const std::exception &) {
      // Nothing may escape the destructor; the session is already closed.
    }
  }

  SessionGuard(const SessionGuard &) = delete;
  SessionGuard &operator=(const SessionGuard &) = delete;

  [[nodiscard]] const transport::Session &session() const { return session_; }

private:
  transport::TransportClient &client_;
  transport::Session session_;
  observability::IObserver &observer_;
};

} // namespace

std::string format_group_caption(const std::string &message, const FileGroup &group) {
  const std::string suffix =
      "(Group " + std::to_string(group.index) + "/" + std::to_string(group.total) + ")";
  if (message.empty()) {
    return suffix;
  }
  return message + "\n\n" + suffix;
}

DispatchEngine::DispatchEngine(observability::IObserver &observer, Waiter &waiter,
                               const CancellationToken &token, const EngineOptions options)
    : observer_(observer), waiter_(waiter), token_(token), options_(options) {}

DispatchReport DispatchEngine::simulate(const DispatchRequest &request,
                                        const std::vector<FileGroup> &groups) const {
  DispatchReport report;
  report.dry_run = true;
  if (groups.empty()) {
    report.planned_units = 1;
    observer_.record_event(observability::DryRunUnitEvent{
        .unit = "message",
        .detail = "chat ID " + std::to_string(request.chat_id) + ": " +
                  message_preview(request.message_text)});
    report.unit_results.push_back(UnitResult{.kind = UnitKind::Message,
                                             .label = "message",
                                             .outcome = AttemptSucceeded{.attempts = 0}});
    return report;
  }

  report.planned_units = groups.size();
  for (const auto &group : groups) {
    const std::string label = group_label(group);
    observer_.record_event(
        observability::DryRunUnitEvent{.unit = label, .detail = file_preview(group)});
    report.unit_results.push_back(UnitResult{
        .kind = UnitKind::FileGroup, .label = label, .outcome = AttemptSucceeded{.attempts = 0}});
  }
  return report;
}

ReportResult DispatchEngine::run(const DispatchRequest &request,
                                 transport::TransportClient &client,
                                 const transport::Credentials &credentials,
                                 const RetryPolicy &policy) const {
  const auto started = std::chrono::steady_clock::now();
  const auto elapsed_since_start = [&started]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
  };

  if (auto valid = validate_policy(policy); !valid.ok()) {
    return ReportResult::failure(valid);
  }
  auto planned = plan_file_groups(request.files, request.max_group_size);
  if (!planned.ok()) {
    return ReportResult::failure(planned.status());
  }
  const std::vector<FileGroup> &groups = planned.value();

  if (groups.empty() && request.files_pattern.has_value()) {
    observer_.notice(observability::LogLevel::Warning,
                     "No files found matching pattern: " + *request.files_pattern +
                         "; sending the message alone");
  }

  const std::size_t planned_units = groups.empty() ? 1 : groups.size();
  observer_.record_event(observability::RunStartEvent{
      .chat_id = request.chat_id, .planned_units = planned_units, .dry_run = request.dry_run});

  const auto finish = [this, &elapsed_since_start](DispatchReport report) {
    report.elapsed = elapsed_since_start();
    observer_.record_metric(observability::RunElapsedMetric{.elapsed = report.elapsed});
    observer_.record_event(observability::RunEndEvent{
        .state = std::string(run_state_name(report.state)),
        .succeeded = report.unit_results.size() - report.failed_count(),
        .failed = report.failed_count(),
        .elapsed = report.elapsed});
    return ReportResult::success(std::move(report));
  };

  if (request.dry_run) {
    return finish(simulate(request, groups));
  }

  DispatchReport report;
  report.planned_units = planned_units;
  if (token_.is_cancelled()) {
    report.state = RunState::Cancelled;
    return finish(std::move(report));
  }

  auto opened = client.open(credentials);
  if (!opened.ok()) {
    observer_.error("session", "run aborted: " + opened.error());
    return ReportResult::failure(common::ErrorKind::Session, opened.error());
  }
  observer_.record_event(observability::SessionOpenedEvent{.bot_username = opened.value().bot_username});

  SessionGuard guard(client, std::move(opened.value()), observer_);
  const RetryExecutor executor(waiter_, token_, observer_);

  // Records one unit's outcome; false once the run must stop.
  const auto settle = [&report](common::Result<AttemptOutcome> outcome, UnitKind kind,
                                const std::string &label) -> common::Result<bool> {
    if (!outcome.ok()) {
      if (outcome.kind() == common::ErrorKind::Interrupted) {
        report.state = RunState::Cancelled;
        return common::Result<bool>::success(false);
      }
      return common::Result<bool>::failure(outcome.status());
    }
    report.unit_results.push_back(
        UnitResult{.kind = kind, .label = label, .outcome = std::move(outcome.value())});
    return common::Result<bool>::success(true);
  };

  if (groups.empty()) {
    const auto &session = guard.session();
    auto outcome = executor.execute(
        "message",
        [&]() {
          return client.send_text(session, request.chat_id, request.topic_id,
                                  request.message_text);
        },
        policy);
    auto settled = settle(std::move(outcome), UnitKind::Message, "message");
    if (!settled.ok()) {
      return ReportResult::failure(settled.status());
    }
  } else {
    observer_.notice(observability::LogLevel::Info,
                     "Sending " + std::to_string(request.files.size()) + " files in " +
                         std::to_string(groups.size()) + " groups");
  }

  for (const auto &group : groups) {
    const std::string label = group_label(group);
    const std::string caption = format_group_caption(request.message_text, group);
    const auto &session = guard.session();
    auto outcome = executor.execute(
        label,
        [&]() {
          return client.send_files(session, request.chat_id, request.topic_id, group.items,
                                   caption);
        },
        policy);
    auto settled = settle(std::move(outcome), UnitKind::FileGroup, label);
    if (!settled.ok()) {
      return ReportResult::failure(settled.status());
    }
    if (!settled.value()) {
      break;
    }
    if (group.index < group.total && !waiter_.wait_for(options_.pacing_delay, token_)) {
      report.state = RunState::Cancelled;
      break;
    }
  }

  if (report.state == RunState::Cancelled) {
    observer_.notice(observability::LogLevel::Warning, "Operation cancelled by user");
  }
  return finish(std::move(report));
}

} // namespace teledrop::dispatch
