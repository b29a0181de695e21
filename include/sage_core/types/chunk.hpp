#pragma once

#include <string>

namespace sage_core {

struct Chunk {
  std::string content;
  int chunk_index;
};

}  // namespace sage_core
