#include <pledge/common/critical.hpp>
#include <pledge/rpc/transport.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace pledge::rpc {

namespace {

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_ptr =
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// Process-wide libcurl state, initialised on first use.
struct curl_global final {
  curl_global() {
    if (auto code = curl_global_init(CURL_GLOBAL_DEFAULT); code != CURLE_OK) {
      pledge::common::critical("curl_global_init failed: {}",
                               curl_easy_strerror(code));
    }
  }
  ~curl_global() { curl_global_cleanup(); }
};

void ensure_curl_global() { static auto global = curl_global{}; }

size_t write_callback(char* contents,
                      const size_t size,
                      const size_t nmemb,
                      void* userp) {
  auto* out = static_cast<std::string*>(userp);
  out->append(contents, size * nmemb);
  return size * nmemb;
}

std::string escape(CURL* handle, const std::string& value) {
  auto* escaped =
      curl_easy_escape(handle, value.data(), static_cast<int>(value.size()));
  if (escaped == nullptr) {
    pledge::common::critical("curl_easy_escape failed for {} bytes",
                             value.size());
  }
  auto out = std::string{escaped};
  curl_free(escaped);
  return out;
}

std::string make_url(CURL* handle, const http_request& request) {
  auto url = request.url;
  auto separator = '?';
  for (const auto& [name, value] : request.query) {
    url.push_back(separator);
    url += escape(handle, name);
    url.push_back('=');
    url += escape(handle, value);
    separator = '&';
  }
  return url;
}

transport_status failure_status(const CURLcode code) {
  switch (code) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
      return transport_status::connect_failed;
    case CURLE_OPERATION_TIMEDOUT:
      return transport_status::timed_out;
    default:
      return transport_status::exchange_failed;
  }
}

http_response perform(const http_request& request,
                      const std::chrono::milliseconds timeout) {
  ensure_curl_global();

  auto handle = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!handle) {
    return http_response{.status = transport_status::connect_failed,
                         .error = "curl_easy_init failed"};
  }

  auto url = make_url(handle.get(), request);
  auto response = http_response{};
  auto headers = curl_slist_ptr{nullptr, curl_slist_free_all};
  auto error_buffer = std::string(CURL_ERROR_SIZE, '\0');

  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(timeout.count()));
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer.data());
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);

  if (request.method == http_method::post) {
    if (!request.content_type.empty()) {
      auto header = "Content-Type: " + request.content_type;
      headers.reset(curl_slist_append(headers.release(), header.c_str()));
      curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
  }

  spdlog::debug("{} {}", request.method == http_method::post ? "POST" : "GET",
                url);
  auto code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    response.status = failure_status(code);
    response.error = error_buffer.c_str();
    if (response.error.empty()) {
      response.error = curl_easy_strerror(code);
    }
    return response;
  }

  auto status_code = long{};
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status_code);
  response.status_code = status_code;
  spdlog::debug("HTTP {} with {} body bytes", response.status_code,
                response.body.size());
  return response;
}

}  // namespace

transport_t make_curl_transport(const std::chrono::milliseconds timeout) {
  return [timeout](const http_request& request) {
    return perform(request, timeout);
  };
}

std::string trim_endpoint(const std::string_view url) {
  auto end = url.find_last_not_of('/');
  if (end == std::string_view::npos) {
    return {};
  }
  return std::string{url.substr(0, end + 1)};
}

}  // namespace pledge::rpc
