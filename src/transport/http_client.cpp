#include "teledrop/transport/http_client.hpp"

#include "teledrop/common/fs.hpp"
#include "teledrop/version.hpp"

#include <curl/curl.h>

#include <utility>

namespace teledrop::transport {

namespace {

constexpr const char *kUserAgent = "teledrop/" TELEDROP_VERSION;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

int progress_callback(void *userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  const auto *should_abort = static_cast<const AbortCheck *>(userdata);
  return (*should_abort)() ? 1 : 0;
}

// Owns the per-request curl handles so every return path releases them.
struct RequestHandles {
  CURL *curl = nullptr;
  curl_slist *headers = nullptr;
  curl_mime *mime = nullptr;

  RequestHandles() : curl(curl_easy_init()) {}
  ~RequestHandles() {
    if (mime != nullptr) {
      curl_mime_free(mime);
    }
    if (headers != nullptr) {
      curl_slist_free_all(headers);
    }
    if (curl != nullptr) {
      curl_easy_cleanup(curl);
    }
  }

  RequestHandles(const RequestHandles &) = delete;
  RequestHandles &operator=(const RequestHandles &) = delete;
};

void prepare_request(RequestHandles &handles, HttpResponse &response, const std::string &url,
                     const std::uint64_t timeout_ms, const AbortCheck &should_abort) {
  curl_easy_setopt(handles.curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handles.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(handles.curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handles.curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handles.curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handles.curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(handles.curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(handles.curl, CURLOPT_USERAGENT, kUserAgent);
  if (should_abort) {
    curl_easy_setopt(handles.curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handles.curl, CURLOPT_XFERINFODATA, &should_abort);
    curl_easy_setopt(handles.curl, CURLOPT_NOPROGRESS, 0L);
  }
}

void perform_request(RequestHandles &handles, HttpResponse &response) {
  const CURLcode code = curl_easy_perform(handles.curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.aborted = code == CURLE_ABORTED_BY_CALLBACK;
    return;
  }
  long status = 0;
  curl_easy_getinfo(handles.curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
}

HttpResponse init_failure() {
  HttpResponse response;
  response.network_error = true;
  response.network_error_message = "curl_easy_init failed";
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient(AbortCheck should_abort) : should_abort_(std::move(should_abort)) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms) {
  RequestHandles handles;
  if (handles.curl == nullptr) {
    return init_failure();
  }

  HttpResponse response;
  prepare_request(handles, response, url, timeout_ms, should_abort_);
  curl_easy_setopt(handles.curl, CURLOPT_POST, 1L);
  curl_easy_setopt(handles.curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handles.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    handles.headers = curl_slist_append(handles.headers, line.c_str());
  }
  if (handles.headers != nullptr) {
    curl_easy_setopt(handles.curl, CURLOPT_HTTPHEADER, handles.headers);
  }

  perform_request(handles, response);
  return response;
}

HttpResponse CurlHttpClient::post_multipart(const std::string &url,
                                            const std::vector<MultipartField> &fields,
                                            const std::uint64_t timeout_ms) {
  RequestHandles handles;
  if (handles.curl == nullptr) {
    return init_failure();
  }

  HttpResponse response;
  prepare_request(handles, response, url, timeout_ms, should_abort_);

  handles.mime = curl_mime_init(handles.curl);
  if (handles.mime == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_mime_init failed";
    return response;
  }

  for (const auto &field : fields) {
    curl_mimepart *part = curl_mime_addpart(handles.mime);
    curl_mime_name(part, field.name.c_str());
    if (field.file.has_value()) {
      const CURLcode code = curl_mime_filedata(part, field.file->string().c_str());
      if (code != CURLE_OK) {
        response.network_error = true;
        response.network_error_message =
            "cannot attach " + field.file->string() + ": " + curl_easy_strerror(code);
        return response;
      }
    } else {
      curl_mime_data(part, field.value.c_str(), field.value.size());
    }
  }
  curl_easy_setopt(handles.curl, CURLOPT_MIMEPOST, handles.mime);

  perform_request(handles, response);
  return response;
}

} // namespace teledrop::transport
