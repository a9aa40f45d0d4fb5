#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace teledrop::dispatch {

using FileRef = std::filesystem::path;

struct DispatchRequest {
  std::string message_text;
  std::int64_t chat_id = 0;
  std::optional<std::int64_t> topic_id;
  std::vector<FileRef> files;
  std::size_t max_group_size = 10;
  bool dry_run = false;
  // Pattern the file list was resolved from, if any. Only used for diagnostics.
  std::optional<std::string> files_pattern;
};

struct FileGroup {
  std::vector<FileRef> items;
  std::size_t index = 0;
  std::size_t total = 0;

  bool operator==(const FileGroup &) const = default;
};

struct RetryPolicy {
  std::uint32_t max_attempts = 3;
  std::chrono::milliseconds delay_between_attempts{5000};
};

struct AttemptSucceeded {
  // Zero for units synthesised by a dry run.
  std::uint32_t attempts = 1;
};

struct AttemptFailed {
  std::string last_error;
  std::uint32_t attempts_made = 0;
};

using AttemptOutcome = std::variant<AttemptSucceeded, AttemptFailed>;

[[nodiscard]] inline bool succeeded(const AttemptOutcome &outcome) {
  return std::holds_alternative<AttemptSucceeded>(outcome);
}

enum class UnitKind {
  Message,
  FileGroup,
};

struct UnitResult {
  UnitKind kind = UnitKind::Message;
  std::string label;
  AttemptOutcome outcome;
};

enum class RunState {
  Completed,
  Cancelled,
};

[[nodiscard]] std::string_view run_state_name(RunState state);

struct DispatchReport {
  RunState state = RunState::Completed;
  bool dry_run = false;
  std::size_t planned_units = 0;
  std::vector<UnitResult> unit_results;
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] std::size_t failed_count() const;
  [[nodiscard]] bool all_succeeded() const;
};

} // namespace teledrop::dispatch
