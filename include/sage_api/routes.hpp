#pragma once
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "sage_core/text/chunker.hpp"
#include "sage_core/types/vector_record.hpp"
#include "server.hpp"

namespace sage_core {
class Retriever;
}  // namespace sage_core

namespace sage_api {

// Texts ready for Retriever::add_knowledge, one entry per chunk.
struct KnowledgeBatch {
  std::vector<std::string> texts;
  std::vector<sage_core::Metadata> metadatas;
};

class Routes {
 public:
  Routes(std::shared_ptr<sage_core::Retriever> retriever,
         sage_core::TextChunker chunker,
         size_t default_top_k);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Applies the chunking policy to uploaded documents. Every chunk keeps its
  // document's metadata plus a "chunk_index" entry.
  static KnowledgeBatch expand_documents(const std::vector<std::string> &texts,
                                         const std::vector<sage_core::Metadata> &metadatas,
                                         const sage_core::TextChunker &chunker,
                                         bool split_long);

  // JSON object -> Metadata; non-string values are kept in their JSON spelling.
  static sage_core::Metadata metadata_from_json(const nlohmann::json &json_metadata);
  static nlohmann::json metadata_to_json(const sage_core::Metadata &metadata);

 private:
  std::shared_ptr<sage_core::Retriever> retriever_;
  sage_core::TextChunker chunker_;
  size_t default_top_k_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_add_knowledge(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_answer(const crow::request &req);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_clear_knowledge(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string extract_query_from_request(const nlohmann::json &json_body);
  size_t extract_top_k_from_request(const nlohmann::json &json_body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_exception_response(const std::string &handler);
};

}  // namespace sage_api
