#include "sage_core/remote/remote_index_client.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "sage_core/errors.hpp"

namespace sage_core {

namespace {
constexpr long HTTP_OK = 200;
constexpr long HTTP_CONFLICT = 409;
}  // namespace

RemoteIndexClient::RemoteIndexClient(const std::string &base_url,
                                     std::shared_ptr<HttpTransport> transport,
                                     RemoteTimeouts timeouts,
                                     const std::string &auth_token)
    : base_url_(base_url),
      transport_(std::move(transport)),
      timeouts_(timeouts),
      auth_token_(auth_token) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string RemoteIndexClient::escape_path_segment(const std::string &segment) {
  std::ostringstream escaped;
  escaped << std::hex << std::uppercase;
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return escaped.str();
}

std::string RemoteIndexClient::index_path(const std::string &name) {
  return "/index/" + escape_path_segment(name);
}

HttpResponse RemoteIndexClient::send(HttpMethod method,
                                     const std::string &path,
                                     const std::string &body,
                                     std::chrono::milliseconds timeout) {
  if (!transport_) {
    throw RemoteIndexError("No HTTP transport configured for " + base_url_);
  }

  HttpRequest request;
  request.method = method;
  request.url = base_url_ + path;
  request.body = body;
  request.timeout = timeout;
  request.headers.push_back("Content-Type: application/json");
  if (!auth_token_.empty()) {
    request.headers.push_back("Authorization: " + auth_token_);
  }
  return transport_->perform(request);
}

void RemoteIndexClient::expect_ok(const HttpResponse &response,
                                  const std::string &operation) const {
  if (response.status_code != HTTP_OK) {
    throw RemoteIndexError(operation + " failed with status code: " +
                           std::to_string(response.status_code));
  }
}

bool RemoteIndexClient::health_check() {
  try {
    return send(HttpMethod::Get, "/health", "", timeouts_.health).status_code == HTTP_OK;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Health check against " << base_url_ << " failed: " << e.what()
              << std::endl;
    return false;
  }
}

void RemoteIndexClient::create_index(const std::string &name,
                                     size_t dimension,
                                     const std::string &quantization) {
  nlohmann::json payload = {
      {"index_name", name}, {"dimension", dimension}, {"quantization", quantization}};

  HttpResponse response =
      send(HttpMethod::Post, "/index/create", payload.dump(), timeouts_.create);
  if (response.status_code == HTTP_CONFLICT) {
    return;
  }
  expect_ok(response, "create_index(" + name + ")");
}

void RemoteIndexClient::insert(const std::string &name, const std::vector<VectorRecord> &records) {
  if (records.empty()) {
    return;
  }

  nlohmann::json payload = nlohmann::json::array();
  for (const auto &record : records) {
    payload.push_back({{"id", record.id}, {"vector", record.vector}});
  }

  HttpResponse response =
      send(HttpMethod::Post, index_path(name) + "/vector/insert", payload.dump(), timeouts_.insert);
  expect_ok(response, "insert(" + name + ")");
}

std::vector<ScoredId> RemoteIndexClient::search(const std::string &name,
                                                const std::vector<float> &query_vector,
                                                size_t k) {
  nlohmann::json payload = {{"vector", query_vector}, {"k", k}, {"include_vectors", false}};

  HttpResponse response =
      send(HttpMethod::Post, index_path(name) + "/search", payload.dump(), timeouts_.search);
  expect_ok(response, "search(" + name + ")");

  // Anything but {"results": [{"id": str, "score": num}, ...]} is a failed search
  try {
    nlohmann::json body = nlohmann::json::parse(response.body);
    if (!body.is_object() || !body.contains("results") || !body["results"].is_array()) {
      throw RemoteIndexError("Search response has no results array");
    }

    std::vector<ScoredId> hits;
    hits.reserve(body["results"].size());
    for (const auto &item : body["results"]) {
      if (!item.is_object() || !item.contains("id") || !item["id"].is_string() ||
          !item.contains("score") || !item["score"].is_number()) {
        throw RemoteIndexError("Malformed search result entry: " + item.dump());
      }
      hits.push_back({item["id"].get<std::string>(), item["score"].get<float>()});
    }
    return hits;
  } catch (const nlohmann::json::exception &e) {
    throw RemoteIndexError("Could not parse search response: " + std::string(e.what()));
  }
}

void RemoteIndexClient::delete_index(const std::string &name) {
  HttpResponse response = send(HttpMethod::Delete, index_path(name), "", timeouts_.remove);
  expect_ok(response, "delete_index(" + name + ")");
}

std::optional<nlohmann::json> RemoteIndexClient::get_stats() {
  try {
    HttpResponse response = send(HttpMethod::Get, "/stats", "", timeouts_.stats);
    if (response.status_code != HTTP_OK) {
      return std::nullopt;
    }
    return nlohmann::json::parse(response.body);
  } catch (const std::exception &e) {
    std::cerr << "Warning: Could not fetch stats from " << base_url_ << ": " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

}  // namespace sage_core
