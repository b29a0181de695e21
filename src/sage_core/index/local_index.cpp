#include "sage_core/index/local_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "sage_core/errors.hpp"

namespace sage_core {

LocalIndex::LocalIndex(size_t dimension)
    : dimension_(dimension),
      faiss_index_(std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension))) {
  if (dimension_ == 0) {
    throw ConfigurationError("Index dimension must be greater than 0");
  }
}

LocalIndex::~LocalIndex() = default;

void LocalIndex::validate_vector(const std::vector<float> &vector, const std::string &what) const {
  if (vector.size() != dimension_) {
    throw ConfigurationError("Vector dimension mismatch for " + what + ". Expected " +
                             std::to_string(dimension_) + ", got " +
                             std::to_string(vector.size()));
  }
  float norm_sqr = faiss::fvec_norm_L2sqr(vector.data(), dimension_);
  if (!std::isfinite(norm_sqr)) {
    throw ConfigurationError("Vector for " + what + " contains non-finite values");
  }
  if (norm_sqr == 0.0f) {
    throw ConfigurationError("Zero vector for " + what + " cannot be normalised");
  }
}

std::vector<float> LocalIndex::normalized(const std::vector<float> &vector) const {
  std::vector<float> copy(vector);
  faiss::fvec_renorm_L2(dimension_, 1, copy.data());
  return copy;
}

void LocalIndex::insert(const VectorRecord &record) {
  insert_many({record});
}

void LocalIndex::insert_many(const std::vector<VectorRecord> &records) {
  if (records.empty()) {
    return;
  }

  // Validate the whole batch before anything is written
  std::unordered_set<std::string> batch_ids;
  for (const auto &record : records) {
    if (record.id.empty()) {
      throw ConfigurationError("Record id cannot be empty");
    }
    if (id_to_position_.count(record.id) > 0 || !batch_ids.insert(record.id).second) {
      throw ConfigurationError("Duplicate record id: " + record.id);
    }
    validate_vector(record.vector, "record " + record.id);
  }

  std::vector<float> flat;
  flat.reserve(records.size() * dimension_);
  for (const auto &record : records) {
    std::vector<float> unit = normalized(record.vector);
    flat.insert(flat.end(), unit.begin(), unit.end());
  }
  faiss_index_->add(static_cast<faiss::idx_t>(records.size()), flat.data());

  records_.reserve(records_.size() + records.size());
  for (const auto &record : records) {
    id_to_position_[record.id] = records_.size();
    records_.push_back(record);
  }
}

std::vector<ScoredId> LocalIndex::rank(const std::vector<float> &query_vector, size_t k) const {
  if (records_.empty() || k == 0) {
    return {};
  }
  validate_vector(query_vector, "query");

  // Rank everything so ties can be settled by insertion order before truncating
  const faiss::idx_t total = faiss_index_->ntotal;
  std::vector<float> unit_query = normalized(query_vector);
  std::vector<float> scores(total);
  std::vector<faiss::idx_t> labels(total);
  faiss_index_->search(1, unit_query.data(), total, scores.data(), labels.data());

  std::vector<std::pair<float, size_t>> ranked;
  ranked.reserve(total);
  for (faiss::idx_t i = 0; i < total; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    ranked.emplace_back(std::clamp(scores[i], -1.0f, 1.0f), static_cast<size_t>(labels[i]));
  }
  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    if (a.first != b.first) {
      return a.first > b.first;
    }
    return a.second < b.second;
  });
  if (ranked.size() > k) {
    ranked.resize(k);
  }

  std::vector<ScoredId> hits;
  hits.reserve(ranked.size());
  for (const auto &[score, position] : ranked) {
    hits.push_back({records_[position].id, score});
  }
  return hits;
}

std::vector<SearchResult> LocalIndex::search(const std::vector<float> &query_vector,
                                             size_t k) const {
  std::vector<SearchResult> results;
  for (const auto &hit : rank(query_vector, k)) {
    const VectorRecord &record = records_[id_to_position_.at(hit.id)];
    results.push_back({record.id, record.text, hit.score, record.metadata});
  }
  return results;
}

bool LocalIndex::contains(const std::string &id) const {
  return id_to_position_.count(id) > 0;
}

const VectorRecord *LocalIndex::find(const std::string &id) const {
  auto it = id_to_position_.find(id);
  if (it == id_to_position_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

void LocalIndex::clear() {
  records_.clear();
  id_to_position_.clear();
  faiss_index_->reset();
}

void LocalIndex::add(const std::vector<VectorRecord> &records) {
  insert_many(records);
}

std::vector<ScoredId> LocalIndex::query(const std::vector<float> &vector, size_t k) {
  return rank(vector, k);
}

}  // namespace sage_core
