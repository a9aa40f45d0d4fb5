#include "teledrop/transport/telegram.hpp"

#include "teledrop/common/fs.hpp"
#include "teledrop/common/json_util.hpp"

#include <sstream>
#include <system_error>

namespace teledrop::transport {

namespace {

constexpr const char *kParseMode = "HTML";

common::Status transport_error(std::string message) {
  return common::Status::error(common::ErrorKind::Transport, std::move(message));
}

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

common::Status check_session(const Session &session) {
  if (!session.open || session.base_url.empty()) {
    return transport_error("telegram session is not open");
  }
  return common::Status::success();
}

} // namespace

TelegramBotClient::TelegramBotClient(std::shared_ptr<HttpClient> http_client,
                                     const TelegramTimeouts timeouts)
    : http_client_(std::move(http_client)), timeouts_(timeouts) {}

common::Result<Session> TelegramBotClient::open(const Credentials &credentials) {
  if (http_client_ == nullptr) {
    return common::Result<Session>::failure(common::ErrorKind::Session,
                                            "telegram http client unavailable");
  }
  const std::string token = common::trim(credentials.bot_token);
  if (token.empty()) {
    return common::Result<Session>::failure(common::ErrorKind::Session,
                                            "telegram bot_token is required");
  }
  const std::string api_base = strip_trailing_slash(common::trim(credentials.api_base_url));
  if (api_base.empty()) {
    return common::Result<Session>::failure(common::ErrorKind::Session,
                                            "telegram api base url is required");
  }

  Session session;
  session.base_url = api_base + "/bot" + token;

  const auto response = http_client_->post_json(session.base_url + "/getMe",
                                                {{"Content-Type", "application/json"}}, "{}",
                                                timeouts_.api_call_ms);
  const auto status = check_api_response(response, "getMe");
  if (!status.ok()) {
    return common::Result<Session>::failure(common::ErrorKind::Session, status.error());
  }

  const std::string me = common::json_get_object(response.body, "result");
  session.bot_username = common::json_get_string(me, "username");
  const std::string id = common::json_get_number(me, "id");
  if (!id.empty()) {
    try {
      session.bot_id = std::stoll(id);
    } catch (const std::exception &) {
      session.bot_id = 0;
    }
  }
  session.open = true;
  return common::Result<Session>::success(std::move(session));
}

common::Status TelegramBotClient::send_text(const Session &session, const std::int64_t chat_id,
                                            const std::optional<std::int64_t> topic_id,
                                            const std::string &text) {
  if (auto status = check_session(session); !status.ok()) {
    return status;
  }

  std::ostringstream body;
  body << "{";
  body << "\"chat_id\":" << chat_id << ",";
  body << "\"text\":\"" << common::json_escape(text) << "\",";
  body << "\"parse_mode\":\"" << kParseMode << "\"";
  if (topic_id.has_value()) {
    body << ",\"message_thread_id\":" << *topic_id;
  }
  body << "}";

  const auto response = http_client_->post_json(session.base_url + "/sendMessage",
                                                {{"Content-Type", "application/json"}},
                                                body.str(), timeouts_.api_call_ms);
  return check_api_response(response, "sendMessage");
}

common::Status TelegramBotClient::send_files(const Session &session, const std::int64_t chat_id,
                                             const std::optional<std::int64_t> topic_id,
                                             const std::vector<std::filesystem::path> &files,
                                             const std::string &caption) {
  if (auto status = check_session(session); !status.ok()) {
    return status;
  }
  if (files.empty()) {
    return transport_error("no files to send");
  }
  if (files.size() > kMaxMediaGroupSize) {
    return transport_error("a media group holds at most " +
                           std::to_string(kMaxMediaGroupSize) + " files, got " +
                           std::to_string(files.size()));
  }
  for (const auto &file : files) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
      return transport_error("file not found: " + file.string());
    }
  }

  std::vector<MultipartField> fields;
  fields.push_back({.name = "chat_id", .value = std::to_string(chat_id)});
  if (topic_id.has_value()) {
    fields.push_back({.name = "message_thread_id", .value = std::to_string(*topic_id)});
  }

  std::string method;
  if (files.size() == 1) {
    method = "sendDocument";
    fields.push_back({.name = "document", .file = files.front()});
    fields.push_back({.name = "caption", .value = caption});
    fields.push_back({.name = "parse_mode", .value = kParseMode});
  } else {
    method = "sendMediaGroup";
    fields.push_back({.name = "media", .value = media_group_json(files.size(), caption)});
    for (std::size_t i = 0; i < files.size(); ++i) {
      fields.push_back({.name = "file" + std::to_string(i), .file = files[i]});
    }
  }

  const auto response =
      http_client_->post_multipart(session.base_url + "/" + method, fields, timeouts_.upload_ms);
  return check_api_response(response, method);
}

common::Status TelegramBotClient::close(Session &session) {
  // The Bot API is stateless over HTTPS; releasing the session is local.
  session.open = false;
  session.base_url.clear();
  return common::Status::success();
}

common::Status TelegramBotClient::check_api_response(const HttpResponse &response,
                                                     const std::string_view method) {
  const std::string op(method);
  if (response.aborted) {
    return common::Status::error(common::ErrorKind::Interrupted, op + " interrupted");
  }
  if (response.timeout) {
    return transport_error(op + " timeout");
  }
  if (response.network_error) {
    return transport_error(op + " network error: " + response.network_error_message);
  }

  const auto ok = common::json_get_bool(response.body, "ok");
  if (response.status >= 200 && response.status < 300 && ok.value_or(false)) {
    return common::Status::success();
  }

  std::string message = op + " failed status=" + std::to_string(response.status);
  const std::string error_code = common::json_get_number(response.body, "error_code");
  if (!error_code.empty()) {
    message += " error_code=" + error_code;
  }
  const std::string description = common::json_get_string(response.body, "description");
  if (!description.empty()) {
    message += " description=\"" + description + "\"";
  } else if (response.status >= 200 && response.status < 300) {
    message += " response missing ok=true";
  } else {
    std::string snippet = common::trim(response.body);
    if (snippet.size() > 240) {
      snippet.resize(240);
    }
    if (!snippet.empty()) {
      message += " body=" + snippet;
    }
  }
  const std::string parameters = common::json_get_object(response.body, "parameters");
  const std::string retry_after = common::json_get_number(parameters, "retry_after");
  if (!retry_after.empty()) {
    message += " retry_after=" + retry_after + "s";
  }
  return transport_error(message);
}

std::string TelegramBotClient::media_group_json(const std::size_t count,
                                                const std::string &caption) {
  std::ostringstream media;
  media << "[";
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) {
      media << ",";
    }
    media << "{\"type\":\"document\",\"media\":\"attach://file" << i << "\"";
    if (i == 0) {
      media << ",\"caption\":\"" << common::json_escape(caption) << "\",\"parse_mode\":\""
            << kParseMode << "\"";
    }
    media << "}";
  }
  media << "]";
  return media.str();
}

} // namespace teledrop::transport
