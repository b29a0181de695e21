#include "sage_core/remote/http_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "sage_core/errors.hpp"

namespace sage_core {

namespace {

std::once_flag curl_global_init_flag;

struct CurlEasyDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlSlistDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

}  // namespace

std::string to_string(HttpMethod method) {
  switch (method) {
    case HttpMethod::Get:
      return "GET";
    case HttpMethod::Post:
      return "POST";
    case HttpMethod::Delete:
      return "DELETE";
    default:
      return "UNKNOWN";
  }
}

CurlHttpTransport::CurlHttpTransport() {
  std::call_once(curl_global_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t CurlHttpTransport::write_callback(void *contents, size_t size, size_t nmemb,
                                         std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

HttpResponse CurlHttpTransport::perform(const HttpRequest &request) {
  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw RemoteIndexError("Failed to initialize CURL");
  }

  std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
  for (const auto &header : request.headers) {
    curl_slist *appended = curl_slist_append(headers.get(), header.c_str());
    if (!appended) {
      throw RemoteIndexError("Failed to build request headers");
    }
    headers.release();
    headers.reset(appended);
  }

  HttpResponse response;
  const long timeout_ms = static_cast<long>(request.timeout.count());

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  // Timeouts must not rely on SIGALRM when called from worker threads
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  switch (request.method) {
    case HttpMethod::Get:
      curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
      break;
    case HttpMethod::Post:
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
      break;
    case HttpMethod::Delete:
      curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
      break;
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw RemoteIndexError(to_string(request.method) + " " + request.url +
                           " failed: " + std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

}  // namespace sage_core
