#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace teledrop::testing {

config::DispatcherConfig mock_config() {
  config::DispatcherConfig config;
  config.bot_token = "123456:test-token";
  config.chat_id = -1001234567890;
  config.message = "Build finished";
  config.retry_delay = 0;
  config.pacing_delay_ms = 0;
  config.log_file.clear();
  return config;
}

MockTransport::MockTransport(CallLog &log) : log_(log) {}

void MockTransport::fail_open(std::string error) { open_error_ = std::move(error); }

void MockTransport::fail_next_sends(const std::size_t count, std::string error) {
  failing_sends_ = count;
  send_error_ = std::move(error);
}

void MockTransport::fail_all_sends(std::string error) {
  fail_all_ = true;
  send_error_ = std::move(error);
}

void MockTransport::fail_send_at(const std::size_t nth, std::string error) {
  fail_at_ = nth;
  send_error_ = std::move(error);
}

common::Result<transport::Session> MockTransport::open(const transport::Credentials &credentials) {
  credentials_ = credentials;
  log_.push_back("open");
  calls_.push_back({.op = "open"});
  if (open_error_.has_value()) {
    return common::Result<transport::Session>::failure(common::ErrorKind::Session, *open_error_);
  }
  return common::Result<transport::Session>::success(transport::Session{
      .base_url = "mock://bot", .bot_username = "mock_bot", .bot_id = 42, .open = true});
}

common::Status MockTransport::send_text(const transport::Session &, const std::int64_t chat_id,
                                        const std::optional<std::int64_t> topic_id,
                                        const std::string &text) {
  log_.push_back("send_text");
  calls_.push_back({.op = "send_text", .chat_id = chat_id, .topic_id = topic_id, .text = text});
  return next_send_status();
}

common::Status MockTransport::send_files(const transport::Session &, const std::int64_t chat_id,
                                         const std::optional<std::int64_t> topic_id,
                                         const std::vector<std::filesystem::path> &files,
                                         const std::string &caption) {
  log_.push_back("send_files:" + std::to_string(files.size()));
  calls_.push_back({.op = "send_files",
                    .chat_id = chat_id,
                    .topic_id = topic_id,
                    .text = caption,
                    .files = files});
  return next_send_status();
}

common::Status MockTransport::close(transport::Session &session) {
  log_.push_back("close");
  calls_.push_back({.op = "close"});
  session.open = false;
  return common::Status::success();
}

std::size_t MockTransport::count(const std::string &op) const {
  std::size_t total = 0;
  for (const auto &call : calls_) {
    if (call.op == op) {
      ++total;
    }
  }
  return total;
}

common::Status MockTransport::next_send_status() {
  ++sends_;
  if (fail_all_ || sends_ == fail_at_) {
    return common::Status::error(common::ErrorKind::Transport, send_error_);
  }
  if (failing_sends_ > 0) {
    --failing_sends_;
    return common::Status::error(common::ErrorKind::Transport, send_error_);
  }
  return common::Status::success();
}

void RecordingWaiter::interrupt_on(const std::size_t nth, dispatch::CancellationToken &token) {
  interrupt_nth_ = nth;
  interrupt_token_ = &token;
}

bool RecordingWaiter::wait_for(const std::chrono::milliseconds delay,
                               const dispatch::CancellationToken &token) {
  delays_.push_back(delay);
  if (log_ != nullptr) {
    log_->push_back("wait:" + std::to_string(delay.count()));
  }
  if (interrupt_token_ != nullptr && delays_.size() == interrupt_nth_) {
    interrupt_token_->cancel();
  }
  return !token.is_cancelled();
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  metrics_.push_back(metric);
}

bool CapturingObserver::saw(const std::string &needle) const {
  for (const auto &event : events_) {
    if (observability::format_event(event).find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

void MockHttpClient::push_response(transport::HttpResponse response) {
  responses_.push_back(std::move(response));
}

transport::HttpResponse
MockHttpClient::post_json(const std::string &url,
                          const std::unordered_map<std::string, std::string> &,
                          const std::string &body, const std::uint64_t timeout_ms) {
  requests_.push_back({.url = url, .body = body, .timeout_ms = timeout_ms});
  return next_response();
}

transport::HttpResponse
MockHttpClient::post_multipart(const std::string &url,
                               const std::vector<transport::MultipartField> &fields,
                               const std::uint64_t timeout_ms) {
  requests_.push_back({.url = url, .fields = fields, .timeout_ms = timeout_ms});
  if (cancel_token_ != nullptr) {
    cancel_token_->cancel();
    transport::HttpResponse response;
    response.network_error = true;
    response.aborted = true;
    response.network_error_message = "Operation was aborted by an application callback";
    return response;
  }
  return next_response();
}

transport::HttpResponse MockHttpClient::next_response() {
  if (responses_.empty()) {
    return ok_response();
  }
  auto response = std::move(responses_.front());
  responses_.pop_front();
  return response;
}

transport::HttpResponse ok_response(const std::string &result_json) {
  transport::HttpResponse response;
  response.status = 200;
  response.body = "{\"ok\":true,\"result\":" + result_json + "}";
  return response;
}

transport::HttpResponse api_error_response(const std::uint16_t status, const int error_code,
                                           const std::string &description) {
  transport::HttpResponse response;
  response.status = status;
  response.body = "{\"ok\":false,\"error_code\":" + std::to_string(error_code) +
                  ",\"description\":\"" + description + "\"}";
  return response;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("teledrop-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
  return file_path;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

} // namespace teledrop::testing
