#include "sage_core/text/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>

#include "sage_core/errors.hpp"

namespace sage_core {

namespace {

// Byte offset of every code point in `text`, followed by text.size().
std::vector<size_t> code_point_offsets(const std::string &text) {
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  offsets.push_back(text.size());
  return offsets;
}

// Invalid sequences become U+FFFD so every later step can walk code points safely.
std::string repair_utf8(const std::string &text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string repaired;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
  return repaired;
}

}  // namespace

TextChunker::TextChunker(size_t chunk_size, size_t overlap, size_t long_document_threshold)
    : chunk_size_(chunk_size), overlap_(overlap), long_document_threshold_(long_document_threshold) {
  validate_sizes(chunk_size_, overlap_);
}

void TextChunker::validate_sizes(size_t chunk_size, size_t overlap) {
  if (chunk_size == 0) {
    throw ConfigurationError("chunk_size must be greater than 0");
  }
  if (overlap >= chunk_size) {
    throw ConfigurationError("overlap (" + std::to_string(overlap) +
                             ") must be smaller than chunk_size (" + std::to_string(chunk_size) +
                             ")");
  }
}

std::string TextChunker::trim(const std::string &text) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(text.begin(), text.end(), is_space);
  auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

std::vector<Chunk> TextChunker::chunk(const std::string &text, size_t chunk_size, size_t overlap) {
  validate_sizes(chunk_size, overlap);

  std::vector<Chunk> chunks;
  if (text.empty()) {
    return chunks;
  }

  const std::string content = repair_utf8(text);

  const std::vector<size_t> offsets = code_point_offsets(content);
  const size_t length = offsets.size() - 1;

  int chunk_index = 0;
  size_t start = 0;
  while (start < length) {
    size_t end = std::min(start + chunk_size, length);

    if (end < length) {
      // '.' is a single byte in UTF-8, so checking the first byte of each code point is exact.
      for (size_t i = end; i > start; --i) {
        if (content[offsets[i - 1]] == '.') {
          if (i - 1 - start >= chunk_size / 2) {
            end = i;
          }
          break;
        }
      }
    }

    std::string piece = trim(content.substr(offsets[start], offsets[end] - offsets[start]));
    if (!piece.empty()) {
      chunks.push_back({.content = std::move(piece), .chunk_index = chunk_index++});
    }

    if (end >= length) {
      break;
    }

    size_t next_start = end > overlap ? end - overlap : 0;
    if (next_start <= start) {
      next_start = end;
    }
    start = next_start;
  }

  return chunks;
}

std::vector<Chunk> TextChunker::split_document(const std::string &text) const {
  const std::string content = repair_utf8(text);
  const size_t length = static_cast<size_t>(utf8::distance(content.begin(), content.end()));
  if (length > long_document_threshold_) {
    return chunk(content, chunk_size_, overlap_);
  }

  std::string piece = trim(content);
  if (piece.empty()) {
    return {};
  }
  return {{.content = std::move(piece), .chunk_index = 0}};
}

}  // namespace sage_core
