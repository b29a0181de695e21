#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sage_core/types/vector_record.hpp"

namespace sage_core {

// What the vector store needs from a storage backend: accept records and rank ids
// for a query vector. Hydrating ids back into text is the store's job.
class IndexBackend {
 public:
  virtual ~IndexBackend() = default;

  virtual void add(const std::vector<VectorRecord> &records) = 0;
  virtual std::vector<ScoredId> query(const std::vector<float> &vector, size_t k) = 0;
  virtual std::string name() const = 0;
};

}  // namespace sage_core
