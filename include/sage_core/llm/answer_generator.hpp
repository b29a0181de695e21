#pragma once

#include <optional>
#include <string>

namespace sage_core {

// Turns a question plus retrieved context into a natural-language answer.
class AnswerGenerator {
 public:
  virtual ~AnswerGenerator() = default;

  virtual bool is_available() = 0;
  virtual std::string generate(const std::string &prompt,
                               const std::optional<std::string> &context = std::nullopt) = 0;
};

}  // namespace sage_core
