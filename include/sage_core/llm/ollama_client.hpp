#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sage_core/llm/answer_generator.hpp"
#include "sage_core/llm/embedding_provider.hpp"

namespace sage_core {

class OllamaClient : public EmbeddingProvider, public AnswerGenerator {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               int timeout_seconds = 60);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> embed_one(const std::string &text) override;
  std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts) override;

  // Embeds a probe string the first time it is called and caches the length.
  size_t dimension() override;

  bool is_available() override;
  std::string generate(const std::string &prompt,
                       const std::optional<std::string> &context = std::nullopt) override;

  // Wraps the question in the retrieval prompt used for grounded answers.
  static std::string build_prompt(const std::string &prompt,
                                  const std::optional<std::string> &context);

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  int timeout_seconds_;

  // ollama-hpp shares one HTTP client process-wide
  std::mutex request_mutex_;
  std::mutex dimension_mutex_;
  std::optional<size_t> dimension_;

  void setup_server_connection();
};

}  // namespace sage_core
