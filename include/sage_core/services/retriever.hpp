#pragma once

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "sage_core/llm/answer_generator.hpp"
#include "sage_core/llm/embedding_provider.hpp"
#include "sage_core/types/vector_record.hpp"
#include "sage_core/vector_store.hpp"

namespace sage_core {

struct RetrieverStats {
  size_t count;
  size_t dimension;
  std::string backend;
};

class Retriever {
 public:
  static constexpr size_t DEFAULT_TOP_K = 3;
  static constexpr size_t CONTEXT_PREVIEW_CHARS = 2000;
  static constexpr const char *INSUFFICIENT_INFORMATION_MESSAGE =
      "I don't have enough information to answer that yet. "
      "Try adding some knowledge to my database first!";

  // generator may be null; answers then fall back to a formatted list of passages.
  Retriever(std::shared_ptr<EmbeddingProvider> embedding_provider,
            std::shared_ptr<VectorStore> vector_store,
            std::shared_ptr<AnswerGenerator> answer_generator = nullptr);

  // Texts are stored as given; splitting long documents is the caller's decision.
  std::vector<std::string> add_knowledge(const std::vector<std::string> &texts,
                                         const std::vector<Metadata> &metadatas = {});

  std::vector<SearchResult> query(const std::string &text, size_t top_k = DEFAULT_TOP_K);

  std::string answer(const std::string &text, size_t top_k = DEFAULT_TOP_K);

  RetrieverStats stats() const;

  // Active backend, document count and, when connected, the remote service's own stats.
  nlohmann::json backend_info() const;

  void clear_knowledge();

  // "[Source i: <source>]\n<text>" blocks separated by blank lines, as fed to the generator.
  static std::string build_context(const std::vector<SearchResult> &results);
  static std::string format_fallback_answer(const std::vector<SearchResult> &results);

 private:
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<AnswerGenerator> answer_generator_;
};

}  // namespace sage_core
