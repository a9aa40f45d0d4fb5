#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace teledrop::transport {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  // The transfer was stopped by the client's abort check.
  bool aborted = false;
  std::string network_error_message;
};

/// One part of a multipart/form-data body. When file is set the part streams that
/// file and value is ignored.
struct MultipartField {
  std::string name;
  std::string value;
  std::optional<std::filesystem::path> file;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_multipart(const std::string &url,
                                                    const std::vector<MultipartField> &fields,
                                                    std::uint64_t timeout_ms) = 0;
};

/// Polled while a transfer runs; returning true stops it.
using AbortCheck = std::function<bool()>;

class CurlHttpClient final : public HttpClient {
public:
  explicit CurlHttpClient(AbortCheck should_abort = {});
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_multipart(const std::string &url,
                                            const std::vector<MultipartField> &fields,
                                            std::uint64_t timeout_ms) override;

private:
  AbortCheck should_abort_;
};

} // namespace teledrop::transport
