#include "sage_core/vector_store.hpp"

#include <faiss/utils/distances.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "sage_core/errors.hpp"

namespace sage_core {

namespace {

constexpr size_t ID_HEX_LENGTH = 16;

std::string sha256_hex(const std::string &content) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1 ||
      EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to compute SHA256 digest");
  }
  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

VectorStore::VectorStore(size_t dimension,
                         std::shared_ptr<RemoteIndexClient> remote_client,
                         const std::string &index_name,
                         const std::string &quantization)
    : dimension_(dimension),
      index_name_(index_name),
      quantization_(quantization),
      remote_client_(std::move(remote_client)),
      local_index_(dimension) {
  if (remote_client_) {
    remote_index_ = std::make_unique<RemoteIndex>(remote_client_, index_name_);
    connect_remote();
  }

  if (is_using_remote()) {
    std::cout << "Vector store initialized using remote index '" << index_name_ << "' at "
              << remote_client_->base_url() << " (dimension " << dimension_ << ")" << std::endl;
  } else {
    std::cout << "Vector store initialized with in-memory index only (dimension " << dimension_
              << ")" << std::endl;
  }
}

VectorStore::~VectorStore() = default;

// Single probe, no retry loop: the store has to be usable without the remote service
void VectorStore::connect_remote() {
  try {
    if (!remote_client_->health_check()) {
      std::cerr << "Warning: Remote vector service not responding at "
                << remote_client_->base_url() << std::endl;
      return;
    }
    remote_client_->create_index(index_name_, dimension_, quantization_);
    state_ = BackendState::Connected;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Could not connect to remote vector service: " << e.what() << std::endl;
  }
}

IndexBackend *VectorStore::remote_backend() {
  return is_using_remote() ? remote_index_.get() : nullptr;
}

// TODO: re-probe the remote service periodically instead of staying degraded until
// the store is rebuilt.
void VectorStore::degrade(const std::string &operation, const std::string &reason) {
  if (state_.exchange(BackendState::Unavailable) == BackendState::Connected) {
    std::cerr << "Warning: Remote " << operation << " failed: " << reason
              << ". Using the in-memory index from now on." << std::endl;
  }
}

void VectorStore::validate_query(const std::vector<float> &query_vector) const {
  if (query_vector.size() != dimension_) {
    throw ConfigurationError("Query vector dimension mismatch. Expected " +
                             std::to_string(dimension_) + ", got " +
                             std::to_string(query_vector.size()));
  }
  float norm_sqr = faiss::fvec_norm_L2sqr(query_vector.data(), dimension_);
  if (!std::isfinite(norm_sqr) || norm_sqr == 0.0f) {
    throw ConfigurationError("Query vector must be finite and non-zero");
  }
}

std::string VectorStore::generate_id(const std::string &text) {
  return sha256_hex(text + "_" + std::to_string(id_counter_++)).substr(0, ID_HEX_LENGTH);
}

std::string VectorStore::insert(const std::string &text,
                                const std::vector<float> &vector,
                                const Metadata &metadata) {
  return insert_many({text}, {vector}, {metadata}).front();
}

std::vector<std::string> VectorStore::insert_many(const std::vector<std::string> &texts,
                                                  const std::vector<std::vector<float>> &vectors,
                                                  const std::vector<Metadata> &metadatas) {
  if (texts.size() != vectors.size()) {
    throw ConfigurationError("Got " + std::to_string(texts.size()) + " texts but " +
                             std::to_string(vectors.size()) + " vectors");
  }
  if (!metadatas.empty() && metadatas.size() != texts.size()) {
    throw ConfigurationError("Got " + std::to_string(texts.size()) + " texts but " +
                             std::to_string(metadatas.size()) + " metadata entries");
  }
  if (texts.empty()) {
    return {};
  }

  std::vector<VectorRecord> records;
  records.reserve(texts.size());
  size_t total = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < texts.size(); ++i) {
      records.push_back({.id = generate_id(texts[i]),
                         .vector = vectors[i],
                         .text = texts[i],
                         .metadata = metadatas.empty() ? Metadata{} : metadatas[i]});
    }
    local_index_.insert_many(records);
    total = local_index_.size();
  }

  // The local copy is already durable; a remote failure only costs the remote copy
  bool stored_remotely = false;
  if (IndexBackend *remote = remote_backend()) {
    try {
      remote->add(records);
      stored_remotely = true;
    } catch (const std::exception &e) {
      degrade("insert", e.what());
    }
  }

  std::cout << "Added " << records.size() << " documents to "
            << (stored_remotely ? "remote and in-memory index" : "in-memory index")
            << " (total: " << total << ")" << std::endl;

  std::vector<std::string> ids;
  ids.reserve(records.size());
  for (const auto &record : records) {
    ids.push_back(record.id);
  }
  return ids;
}

std::vector<SearchResult> VectorStore::hydrate(const std::vector<ScoredId> &hits, size_t k) const {
  std::vector<SearchResult> results;
  results.reserve(std::min(hits.size(), k));
  for (const auto &hit : hits) {
    if (results.size() >= k) {
      break;
    }
    const VectorRecord *record = local_index_.find(hit.id);
    if (!record) {
      std::cerr << "Warning: Remote index returned id " << hit.id
                << " with no local record, skipping" << std::endl;
      continue;
    }
    results.push_back({record->id, record->text, hit.score, record->metadata});
  }
  return results;
}

std::vector<SearchResult> VectorStore::search(const std::vector<float> &query_vector, size_t k) {
  if (k == 0 || size() == 0) {
    return {};
  }
  validate_query(query_vector);

  if (IndexBackend *remote = remote_backend()) {
    try {
      std::vector<ScoredId> hits = remote->query(query_vector, k);
      std::lock_guard<std::mutex> lock(mutex_);
      std::vector<SearchResult> results = hydrate(hits, k);
      if (!results.empty()) {
        return results;
      }
      std::cerr << "Warning: Remote search returned no usable results, using in-memory index"
                << std::endl;
    } catch (const std::exception &e) {
      degrade("search", e.what());
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  IndexBackend &local = local_index_;
  return hydrate(local.query(query_vector, k), k);
}

void VectorStore::clear() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    local_index_.clear();
  }

  if (is_using_remote()) {
    try {
      remote_client_->delete_index(index_name_);
      remote_client_->create_index(index_name_, dimension_, quantization_);
    } catch (const std::exception &e) {
      degrade("clear", e.what());
    }
  }

  std::cout << "Vector store cleared (" << backend_name() << ")" << std::endl;
}

size_t VectorStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return local_index_.size();
}

std::string VectorStore::backend_name() const {
  return is_using_remote() ? "remote" : "local";
}

nlohmann::json VectorStore::backend_info() {
  nlohmann::json info = {{"backend", backend_name()},
                         {"connected", is_using_remote()},
                         {"index_name", index_name_},
                         {"dimension", dimension_},
                         {"document_count", size()},
                         {"persistent", is_using_remote()}};

  if (is_using_remote()) {
    if (auto stats = remote_client_->get_stats()) {
      info["remote_stats"] = *stats;
    }
  }
  return info;
}

}  // namespace sage_core
