#include "sage_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"
#include "sage_core/errors.hpp"

namespace sage_core {

namespace {
constexpr const char *DIMENSION_PROBE_TEXT = "dimension probe";
}

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           int timeout_seconds)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model),
      timeout_seconds_(timeout_seconds) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);
  if (!ollama::is_running()) {
    std::cerr << "Warning: Ollama server is not running at " << ollama_url_ << std::endl;
  }
}

std::vector<float> OllamaClient::embed_one(const std::string &text) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw ProviderError("Response does not contain embeddings field");
    }

    // /api/embed answers with an array of vectors even for a single input
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw ProviderError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const ollama::exception &e) {
    throw ProviderError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw ProviderError("Malformed embedding response: " + std::string(e.what()));
  }
}

// ollama-hpp only takes a single input per embedding request
std::vector<std::vector<float>> OllamaClient::embed_many(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

size_t OllamaClient::dimension() {
  std::lock_guard<std::mutex> lock(dimension_mutex_);
  if (!dimension_) {
    auto probe = embed_one(DIMENSION_PROBE_TEXT);
    if (probe.empty()) {
      throw ProviderError("Embedding model " + embedding_model_ + " returned an empty vector");
    }
    dimension_ = probe.size();
  }
  return *dimension_;
}

bool OllamaClient::is_available() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return ollama::is_running();
}

std::string OllamaClient::generate(const std::string &prompt,
                                   const std::optional<std::string> &context) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  try {
    ollama::response response = ollama::generate(generation_model_, build_prompt(prompt, context));
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw ProviderError("Answer generation failed: " + std::string(e.what()));
  }
}

std::string OllamaClient::build_prompt(const std::string &prompt,
                                       const std::optional<std::string> &context) {
  if (!context || context->empty()) {
    return prompt;
  }

  return "You are a helpful AI assistant. Use the provided context information to answer the "
         "user's question accurately.\n\n"
         "CONTEXT FROM DOCUMENTS:\n" +
         *context +
         "\n\n"
         "USER QUESTION: " +
         prompt +
         "\n\n"
         "INSTRUCTIONS:\n"
         "- Answer ONLY using information from the context above\n"
         "- If the context contains relevant information, provide a detailed answer\n"
         "- Be specific and reference the source document\n"
         "- If the context lacks information, clearly state \"The uploaded documents don't "
         "contain information about this\"\n\n"
         "ANSWER:";
}

}  // namespace sage_core
