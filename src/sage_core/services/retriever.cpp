#include "sage_core/services/retriever.hpp"

#include <utf8.h>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "sage_core/errors.hpp"

namespace sage_core {

namespace {

// First `max_chars` code points of `text`, never splitting a multi-byte sequence.
std::string utf8_prefix(const std::string &text, size_t max_chars) {
  auto it = text.begin();
  size_t count = 0;
  try {
    while (it != text.end() && count < max_chars) {
      utf8::next(it, text.end());
      ++count;
    }
  } catch (const utf8::exception &) {
    return text.substr(0, std::min(text.size(), max_chars));
  }
  return std::string(text.begin(), it);
}

}  // namespace

Retriever::Retriever(std::shared_ptr<EmbeddingProvider> embedding_provider,
                     std::shared_ptr<VectorStore> vector_store,
                     std::shared_ptr<AnswerGenerator> answer_generator)
    : embedding_provider_(std::move(embedding_provider)),
      vector_store_(std::move(vector_store)),
      answer_generator_(std::move(answer_generator)) {
  if (!embedding_provider_ || !vector_store_) {
    throw ConfigurationError("Retriever requires an embedding provider and a vector store");
  }
}

std::vector<std::string> Retriever::add_knowledge(const std::vector<std::string> &texts,
                                                  const std::vector<Metadata> &metadatas) {
  if (texts.empty()) {
    return {};
  }
  if (!metadatas.empty() && metadatas.size() != texts.size()) {
    throw ConfigurationError("Got " + std::to_string(texts.size()) + " texts but " +
                             std::to_string(metadatas.size()) + " metadata entries");
  }

  std::cout << "Adding " << texts.size() << " new pieces of knowledge..." << std::endl;

  // Embed everything before touching the store so a provider failure writes nothing
  std::vector<std::vector<float>> embeddings = embedding_provider_->embed_many(texts);
  if (embeddings.size() != texts.size()) {
    throw ProviderError("Embedding provider returned " + std::to_string(embeddings.size()) +
                        " vectors for " + std::to_string(texts.size()) + " texts");
  }

  std::vector<std::string> ids = vector_store_->insert_many(texts, embeddings, metadatas);
  std::cout << "Knowledge base updated. Total items: " << vector_store_->size() << std::endl;
  return ids;
}

std::vector<SearchResult> Retriever::query(const std::string &text, size_t top_k) {
  std::cout << "Searching for: '" << text << "'" << std::endl;

  std::vector<float> query_embedding = embedding_provider_->embed_one(text);
  std::vector<SearchResult> results = vector_store_->search(query_embedding, top_k);

  if (results.empty()) {
    std::cout << "No results found" << std::endl;
  } else {
    std::cout << "Found " << results.size() << " relevant result(s)" << std::endl;
  }
  return results;
}

std::string Retriever::answer(const std::string &text, size_t top_k) {
  std::vector<SearchResult> results = query(text, top_k);
  if (results.empty()) {
    return INSUFFICIENT_INFORMATION_MESSAGE;
  }

  if (answer_generator_ && answer_generator_->is_available()) {
    return answer_generator_->generate(text, build_context(results));
  }
  return format_fallback_answer(results);
}

RetrieverStats Retriever::stats() const {
  return {vector_store_->size(), vector_store_->dimension(), vector_store_->backend_name()};
}

nlohmann::json Retriever::backend_info() const {
  return vector_store_->backend_info();
}

void Retriever::clear_knowledge() {
  vector_store_->clear();
  std::cout << "All knowledge cleared" << std::endl;
}

std::string Retriever::build_context(const std::vector<SearchResult> &results) {
  std::ostringstream context;
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &metadata = results[i].metadata;
    auto source = metadata.find("source");
    if (i > 0) {
      context << "\n\n";
    }
    context << "[Source " << (i + 1) << ": "
            << (source != metadata.end() ? source->second : "Unknown") << "]\n"
            << utf8_prefix(results[i].text, CONTEXT_PREVIEW_CHARS);
  }
  return context.str();
}

std::string Retriever::format_fallback_answer(const std::vector<SearchResult> &results) {
  std::ostringstream response;
  response << "Based on what I know, here's the relevant information:\n\n";
  for (size_t i = 0; i < results.size(); ++i) {
    response << (i + 1) << ". [Relevance: " << std::fixed << std::setprecision(2)
             << results[i].score << "]\n"
             << "   " << results[i].text << "\n\n";
  }
  return response.str();
}

}  // namespace sage_core
