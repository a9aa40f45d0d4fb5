#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace teledrop::common {

enum class ErrorKind {
  Configuration,
  Transport,
  Session,
  Interrupted,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Configuration:
    return "configuration";
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::Session:
    return "session";
  case ErrorKind::Interrupted:
    return "interrupted";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(true, ErrorKind::Transport, ""); }
  static Status error(ErrorKind kind, std::string message) {
    return Status(false, kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, ErrorKind kind, std::string error)
      : ok_(ok), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorKind::Transport, "");
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(false, std::nullopt, kind, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(false, std::nullopt, status.kind(), status.error());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(kind_, error_);
  }

private:
  Result(bool ok, std::optional<T> value, ErrorKind kind, std::string error)
      : ok_(ok), value_(std::move(value)), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorKind kind_;
  std::string error_;
};

} // namespace teledrop::common
