#include "sage_api/routes.hpp"

#include <iostream>
#include <utility>

#include "sage_core/errors.hpp"
#include "sage_core/services/retriever.hpp"

namespace sage_api {

namespace {

nlohmann::json results_to_json(const std::vector<sage_core::SearchResult> &results) {
  nlohmann::json json_results = nlohmann::json::array();
  for (const auto &result : results) {
    json_results.push_back({{"id", result.id},
                            {"text", result.text},
                            {"score", result.score},
                            {"metadata", Routes::metadata_to_json(result.metadata)}});
  }
  return json_results;
}

}  // namespace

Routes::Routes(std::shared_ptr<sage_core::Retriever> retriever,
               sage_core::TextChunker chunker,
               size_t default_top_k)
    : retriever_(retriever), chunker_(chunker), default_top_k_(default_top_k) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/knowledge")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_add_knowledge(req); });

  CROW_ROUTE(app, "/knowledge/clear")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_clear_knowledge(req); });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/answer").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_answer(req);
  });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Sage API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_add_knowledge(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    if (!json_body.contains("texts") || !json_body["texts"].is_array()) {
      return create_json_response(create_error_response("Request must contain a 'texts' array"),
                                  400);
    }

    auto texts = json_body["texts"].get<std::vector<std::string>>();
    std::vector<sage_core::Metadata> metadatas;
    if (json_body.contains("metadatas")) {
      for (const auto &json_metadata : json_body["metadatas"]) {
        metadatas.push_back(metadata_from_json(json_metadata));
      }
    }
    bool split_long = json_body.value("split_long", true);

    KnowledgeBatch batch = expand_documents(texts, metadatas, chunker_, split_long);
    std::cout << "Adding " << texts.size() << " documents as " << batch.texts.size() << " chunks"
              << std::endl;
    std::vector<std::string> ids = retriever_->add_knowledge(batch.texts, batch.metadatas);

    nlohmann::json data = {{"ids", ids}, {"documents", texts.size()}, {"chunks", ids.size()}};
    return create_json_response(create_success_response("Knowledge added", data));
  } catch (const std::exception &) {
    return create_exception_response("handle_add_knowledge");
  }
}

crow::response Routes::handle_query(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string query = extract_query_from_request(json_body);
    size_t top_k = extract_top_k_from_request(json_body);

    std::cout << "Query: " << query << " with top_k: " << top_k << std::endl;
    auto results = retriever_->query(query, top_k);
    return create_json_response({{"results", results_to_json(results)}});
  } catch (const std::exception &) {
    return create_exception_response("handle_query");
  }
}

crow::response Routes::handle_answer(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string query = extract_query_from_request(json_body);
    size_t top_k = extract_top_k_from_request(json_body);

    std::string answer = retriever_->answer(query, top_k);
    return create_json_response({{"query", query}, {"answer", answer}});
  } catch (const std::exception &) {
    return create_exception_response("handle_answer");
  }
}

crow::response Routes::handle_stats(const crow::request &req) {
  try {
    sage_core::RetrieverStats stats = retriever_->stats();
    nlohmann::json response = {{"count", stats.count},
                               {"dimension", stats.dimension},
                               {"backend", stats.backend},
                               {"backend_info", retriever_->backend_info()}};
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_exception_response("handle_stats");
  }
}

crow::response Routes::handle_clear_knowledge(const crow::request &req) {
  try {
    retriever_->clear_knowledge();
    return create_json_response(create_success_response("Knowledge base cleared"));
  } catch (const std::exception &) {
    return create_exception_response("handle_clear_knowledge");
  }
}

KnowledgeBatch Routes::expand_documents(const std::vector<std::string> &texts,
                                        const std::vector<sage_core::Metadata> &metadatas,
                                        const sage_core::TextChunker &chunker,
                                        bool split_long) {
  if (!metadatas.empty() && metadatas.size() != texts.size()) {
    throw sage_core::ConfigurationError("Got " + std::to_string(texts.size()) + " texts but " +
                                        std::to_string(metadatas.size()) + " metadata entries");
  }

  KnowledgeBatch batch;
  for (size_t i = 0; i < texts.size(); ++i) {
    const sage_core::Metadata document_metadata =
        metadatas.empty() ? sage_core::Metadata{} : metadatas[i];

    std::vector<sage_core::Chunk> chunks;
    if (split_long) {
      chunks = chunker.split_document(texts[i]);
    } else if (std::string content = sage_core::TextChunker::trim(texts[i]); !content.empty()) {
      chunks.push_back({.content = std::move(content), .chunk_index = 0});
    }

    for (auto &chunk : chunks) {
      sage_core::Metadata chunk_metadata = document_metadata;
      chunk_metadata["chunk_index"] = std::to_string(chunk.chunk_index);
      batch.texts.push_back(std::move(chunk.content));
      batch.metadatas.push_back(std::move(chunk_metadata));
    }
  }
  return batch;
}

sage_core::Metadata Routes::metadata_from_json(const nlohmann::json &json_metadata) {
  sage_core::Metadata metadata;
  if (json_metadata.is_null()) {
    return metadata;
  }
  if (!json_metadata.is_object()) {
    throw sage_core::ConfigurationError("Metadata entries must be JSON objects");
  }
  for (const auto &[key, value] : json_metadata.items()) {
    metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
  }
  return metadata;
}

nlohmann::json Routes::metadata_to_json(const sage_core::Metadata &metadata) {
  nlohmann::json json_metadata = nlohmann::json::object();
  for (const auto &[key, value] : metadata) {
    json_metadata[key] = value;
  }
  return json_metadata;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

// Must be called from inside a catch block; maps the in-flight exception to a status code.
crow::response Routes::create_exception_response(const std::string &handler) {
  try {
    throw;
  } catch (const sage_core::ConfigurationError &e) {
    std::cerr << "Configuration error in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const sage_core::ProviderError &e) {
    std::cerr << "Provider error in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "Malformed request in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

std::string Routes::extract_query_from_request(const nlohmann::json &json_body) {
  std::string query = json_body.value("query", "");
  if (query.empty()) {
    throw sage_core::ConfigurationError("Request must contain a non-empty 'query'");
  }
  return query;
}

size_t Routes::extract_top_k_from_request(const nlohmann::json &json_body) {
  int top_k = json_body.value("top_k", static_cast<int>(default_top_k_));
  if (top_k <= 0) {
    throw sage_core::ConfigurationError("top_k must be greater than 0");
  }
  return static_cast<size_t>(top_k);
}

}  // namespace sage_api
