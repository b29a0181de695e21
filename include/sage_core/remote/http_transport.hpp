#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sage_core {

enum class HttpMethod { Get, Post, Delete };

std::string to_string(HttpMethod method);

struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::string url;
  std::string body;
  std::vector<std::string> headers;
  std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
  long status_code = 0;
  std::string body;
};

// Blocking HTTP round trip. Implementations throw RemoteIndexError when no response
// was received (connection refused, DNS failure, timeout); any HTTP status is a response.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse perform(const HttpRequest &request) = 0;
};

// libcurl implementation. Each request uses its own easy handle, so one transport
// can be shared between threads.
class CurlHttpTransport : public HttpTransport {
 public:
  CurlHttpTransport();
  ~CurlHttpTransport() override = default;

  CurlHttpTransport(const CurlHttpTransport &) = delete;
  CurlHttpTransport &operator=(const CurlHttpTransport &) = delete;

  HttpResponse perform(const HttpRequest &request) override;

 private:
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace sage_core
