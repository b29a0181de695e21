#pragma once

#include <map>
#include <string>
#include <vector>

namespace sage_core {

// Open key/value map attached to every record. Conventional keys are "source"
// (where the text came from) and "type" (pdf, web, note, ...); neither is required.
using Metadata = std::map<std::string, std::string>;

struct VectorRecord {
  std::string id;
  std::vector<float> vector;
  std::string text;
  Metadata metadata;
};

struct ScoredId {
  std::string id;
  float score;
};

struct SearchResult {
  std::string id;
  std::string text;
  float score;
  Metadata metadata;
};

enum class BackendState { Connected, Unavailable };

inline std::string to_string(BackendState state) {
  switch (state) {
    case BackendState::Connected:
      return "CONNECTED";
    case BackendState::Unavailable:
      return "UNAVAILABLE";
    default:
      return "UNKNOWN";
  }
}

}  // namespace sage_core
