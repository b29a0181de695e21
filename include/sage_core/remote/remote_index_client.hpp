#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "sage_core/remote/http_transport.hpp"
#include "sage_core/types/vector_record.hpp"

namespace sage_core {

struct RemoteTimeouts {
  std::chrono::milliseconds health{2000};
  std::chrono::milliseconds create{10000};
  std::chrono::milliseconds insert{30000};
  std::chrono::milliseconds search{10000};
  std::chrono::milliseconds remove{10000};
  std::chrono::milliseconds stats{5000};
};

/**
 * Client for the external vector database's HTTP/JSON API.
 *
 * Every call is one blocking request bounded by its timeout; there are no
 * retries. Failures raise RemoteIndexError, except health_check and get_stats
 * which report them as false / nullopt.
 */
class RemoteIndexClient {
 public:
  RemoteIndexClient(const std::string &base_url,
                    std::shared_ptr<HttpTransport> transport,
                    RemoteTimeouts timeouts = {},
                    const std::string &auth_token = "");
  virtual ~RemoteIndexClient() = default;

  RemoteIndexClient(const RemoteIndexClient &) = delete;
  RemoteIndexClient &operator=(const RemoteIndexClient &) = delete;

  virtual bool health_check();

  // Succeeds when the index is created or already exists.
  virtual void create_index(const std::string &name,
                            size_t dimension,
                            const std::string &quantization = "FLOAT32");

  virtual void insert(const std::string &name, const std::vector<VectorRecord> &records);

  virtual std::vector<ScoredId> search(const std::string &name,
                                       const std::vector<float> &query_vector,
                                       size_t k);

  virtual void delete_index(const std::string &name);

  virtual std::optional<nlohmann::json> get_stats();

  const std::string &base_url() const {
    return base_url_;
  }

 private:
  std::string base_url_;
  std::shared_ptr<HttpTransport> transport_;
  RemoteTimeouts timeouts_;
  std::string auth_token_;

  HttpResponse send(HttpMethod method,
                    const std::string &path,
                    const std::string &body,
                    std::chrono::milliseconds timeout);
  void expect_ok(const HttpResponse &response, const std::string &operation) const;
  static std::string index_path(const std::string &name);
  static std::string escape_path_segment(const std::string &segment);
};

}  // namespace sage_core
