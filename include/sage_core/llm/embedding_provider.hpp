#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sage_core {

// Maps text to fixed-length vectors. Implementations must be deterministic for a
// fixed model and report failures as ProviderError.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed_one(const std::string &text) = 0;
  virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts) = 0;
  virtual size_t dimension() = 0;
};

}  // namespace sage_core
