#pragma once

#include "teledrop/transport/http_client.hpp"
#include "teledrop/transport/transport.hpp"

#include <memory>
#include <string_view>

namespace teledrop::transport {

struct TelegramTimeouts {
  std::uint64_t api_call_ms = 15000;
  std::uint64_t upload_ms = 300000;
};

/// TransportClient over the Telegram Bot API.
class TelegramBotClient final : public TransportClient {
public:
  static constexpr std::size_t kMaxMediaGroupSize = 10;

  explicit TelegramBotClient(std::shared_ptr<HttpClient> http_client,
                             TelegramTimeouts timeouts = {});

  [[nodiscard]] common::Result<Session> open(const Credentials &credentials) override;
  [[nodiscard]] common::Status send_text(const Session &session, std::int64_t chat_id,
                                         std::optional<std::int64_t> topic_id,
                                         const std::string &text) override;
  [[nodiscard]] common::Status send_files(const Session &session, std::int64_t chat_id,
                                          std::optional<std::int64_t> topic_id,
                                          const std::vector<std::filesystem::path> &files,
                                          const std::string &caption) override;
  common::Status close(Session &session) override;

  /// Maps a Bot API reply to success or a transport error naming the method.
  [[nodiscard]] static common::Status check_api_response(const HttpResponse &response,
                                                         std::string_view method);

  /// The "media" field of a sendMediaGroup call for count attachments.
  [[nodiscard]] static std::string media_group_json(std::size_t count, const std::string &caption);

private:
  std::shared_ptr<HttpClient> http_client_;
  TelegramTimeouts timeouts_;
};

} // namespace teledrop::transport
