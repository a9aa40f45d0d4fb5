#pragma once

#include "teledrop/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace teledrop::transport {

struct Credentials {
  std::string bot_token;
  std::string api_base_url = "https://api.telegram.org";
  // MTProto application credentials. Accepted for configuration compatibility;
  // the Bot API transport authenticates with bot_token alone.
  std::string api_id;
  std::string api_hash;
};

struct Session {
  std::string base_url;
  std::string bot_username;
  std::int64_t bot_id = 0;
  bool open = false;
};

class TransportClient {
public:
  virtual ~TransportClient() = default;

  /// Failures carry ErrorKind::Session.
  [[nodiscard]] virtual common::Result<Session> open(const Credentials &credentials) = 0;

  /// Failures carry ErrorKind::Transport.
  [[nodiscard]] virtual common::Status send_text(const Session &session, std::int64_t chat_id,
                                                 std::optional<std::int64_t> topic_id,
                                                 const std::string &text) = 0;

  [[nodiscard]] virtual common::Status
  send_files(const Session &session, std::int64_t chat_id, std::optional<std::int64_t> topic_id,
             const std::vector<std::filesystem::path> &files, const std::string &caption) = 0;

  /// Best-effort teardown. The caller logs a failed status; it is never raised.
  virtual common::Status close(Session &session) = 0;
};

} // namespace teledrop::transport
