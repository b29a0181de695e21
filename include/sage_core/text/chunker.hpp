#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sage_core/types/chunk.hpp"

namespace sage_core {

/**
 * Splits long documents into overlapping, sentence-aware chunks.
 *
 * Sizes are counted in Unicode code points, not bytes or tokens. A window that
 * does not reach the end of the text is pulled back to just after its last '.'
 * when that period sits in the second half of the window.
 */
class TextChunker {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 1000;
  static constexpr size_t DEFAULT_OVERLAP = 100;
  // Documents at or below this many code points are stored as a single chunk.
  static constexpr size_t DEFAULT_LONG_DOCUMENT_THRESHOLD = 5000;

  explicit TextChunker(size_t chunk_size = DEFAULT_CHUNK_SIZE,
                       size_t overlap = DEFAULT_OVERLAP,
                       size_t long_document_threshold = DEFAULT_LONG_DOCUMENT_THRESHOLD);

  // Throws ConfigurationError when chunk_size is 0 or overlap >= chunk_size.
  static std::vector<Chunk> chunk(const std::string &text, size_t chunk_size, size_t overlap);

  // Applies the long-document policy: short texts come back whole (trimmed),
  // long ones are chunked with this instance's sizes.
  std::vector<Chunk> split_document(const std::string &text) const;

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t overlap() const {
    return overlap_;
  }
  size_t long_document_threshold() const {
    return long_document_threshold_;
  }

  // Strips ASCII whitespace from both ends.
  static std::string trim(const std::string &text);

 private:
  size_t chunk_size_;
  size_t overlap_;
  size_t long_document_threshold_;

  static void validate_sizes(size_t chunk_size, size_t overlap);
};

}  // namespace sage_core
