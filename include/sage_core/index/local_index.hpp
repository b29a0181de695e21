#pragma once

#include <faiss/IndexFlat.h>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "sage_core/index/index_backend.hpp"
#include "sage_core/types/vector_record.hpp"

namespace sage_core {

/**
 * Exact in-memory vector index.
 *
 * Records are kept in insertion order next to an id -> position map; their
 * L2-normalised vectors sit in a flat inner-product Faiss index, so a search is
 * an exact cosine-similarity scan. Equal scores rank by insertion order.
 *
 * Not synchronised. The owning VectorStore serialises access.
 */
class LocalIndex : public IndexBackend {
 public:
  explicit LocalIndex(size_t dimension);
  ~LocalIndex() override;

  LocalIndex(const LocalIndex &) = delete;
  LocalIndex &operator=(const LocalIndex &) = delete;

  // Both throw ConfigurationError without touching the index when any record has
  // the wrong dimension, a zero vector, an empty id or an id already present.
  void insert(const VectorRecord &record);
  void insert_many(const std::vector<VectorRecord> &records);

  std::vector<SearchResult> search(const std::vector<float> &query_vector, size_t k) const;

  bool contains(const std::string &id) const;
  const VectorRecord *find(const std::string &id) const;

  size_t size() const {
    return records_.size();
  }
  size_t dimension() const {
    return dimension_;
  }
  void clear();

  // IndexBackend
  void add(const std::vector<VectorRecord> &records) override;
  std::vector<ScoredId> query(const std::vector<float> &vector, size_t k) override;
  std::string name() const override {
    return "local";
  }

 private:
  size_t dimension_;
  std::vector<VectorRecord> records_;
  std::unordered_map<std::string, size_t> id_to_position_;
  std::unique_ptr<faiss::IndexFlatIP> faiss_index_;

  void validate_vector(const std::vector<float> &vector, const std::string &what) const;
  std::vector<float> normalized(const std::vector<float> &vector) const;
  std::vector<ScoredId> rank(const std::vector<float> &query_vector, size_t k) const;
};

}  // namespace sage_core
