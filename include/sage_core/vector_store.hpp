#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "sage_core/index/local_index.hpp"
#include "sage_core/remote/remote_index.hpp"
#include "sage_core/remote/remote_index_client.hpp"
#include "sage_core/types/vector_record.hpp"

namespace sage_core {

/**
 * Dual-backend vector store.
 *
 * Every record is written to the in-process LocalIndex, which also serves as the
 * id -> text/metadata map. While the remote service is Connected, writes are copied
 * to it and searches are ranked by it, then hydrated locally. The first remote
 * failure switches the store to Unavailable for the rest of its lifetime and all
 * work continues on the local index; callers never see remote errors.
 */
class VectorStore {
 public:
  // A null remote_client gives a local-only store.
  explicit VectorStore(size_t dimension,
                       std::shared_ptr<RemoteIndexClient> remote_client = nullptr,
                       const std::string &index_name = "sage",
                       const std::string &quantization = "FLOAT32");
  ~VectorStore();

  // Non-copyable and non-movable: owns a mutex and the local index
  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;
  VectorStore(VectorStore &&) = delete;
  VectorStore &operator=(VectorStore &&) = delete;

  // Returns the generated id. Throws ConfigurationError on a bad vector.
  std::string insert(const std::string &text,
                     const std::vector<float> &vector,
                     const Metadata &metadata = {});

  // All-or-nothing on the local index. metadatas may be empty.
  std::vector<std::string> insert_many(const std::vector<std::string> &texts,
                                       const std::vector<std::vector<float>> &vectors,
                                       const std::vector<Metadata> &metadatas = {});

  std::vector<SearchResult> search(const std::vector<float> &query_vector, size_t k);

  // Empties the local index; a connected remote index is dropped and recreated.
  void clear();

  size_t size() const;
  size_t dimension() const {
    return dimension_;
  }
  BackendState state() const {
    return state_.load();
  }
  bool is_using_remote() const {
    return state() == BackendState::Connected;
  }
  std::string backend_name() const;
  const std::string &index_name() const {
    return index_name_;
  }

  nlohmann::json backend_info();

 private:
  size_t dimension_;
  std::string index_name_;
  std::string quantization_;
  std::shared_ptr<RemoteIndexClient> remote_client_;
  std::unique_ptr<RemoteIndex> remote_index_;
  std::atomic<BackendState> state_{BackendState::Unavailable};

  // Guards everything below
  mutable std::mutex mutex_;
  LocalIndex local_index_;
  uint64_t id_counter_ = 0;

  void connect_remote();
  IndexBackend *remote_backend();
  void degrade(const std::string &operation, const std::string &reason);
  void validate_query(const std::vector<float> &query_vector) const;

  // Callers hold mutex_
  std::string generate_id(const std::string &text);
  std::vector<SearchResult> hydrate(const std::vector<ScoredId> &hits, size_t k) const;
};

}  // namespace sage_core
