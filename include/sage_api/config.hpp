#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  int num_threads;

  // Ollama (embeddings and answer generation)
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  bool generation_enabled;
  int ollama_timeout_seconds;

  // Remote vector service
  bool remote_enabled;
  std::string remote_url;
  std::string remote_index_name;
  std::string remote_quantization;
  std::string remote_auth_token;
  int remote_health_timeout_ms;
  int remote_create_timeout_ms;
  int remote_insert_timeout_ms;
  int remote_search_timeout_ms;
  int remote_delete_timeout_ms;

  // Chunking policy applied to incoming documents
  int chunk_size;
  int chunk_overlap;
  int long_document_threshold;
  int default_top_k;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.num_threads = json_config.value("num_threads", 2);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.generation_enabled = json_config.value("generation_enabled", true);
      config.ollama_timeout_seconds = json_config.value("ollama_timeout_seconds", 60);

      config.remote_enabled = json_config.value("remote_enabled", true);
      config.remote_url = json_config.value("remote_url", std::string("http://localhost:8080/api/v1"));
      config.remote_index_name = json_config.value("remote_index_name", std::string("sage"));
      config.remote_quantization = json_config.value("remote_quantization", std::string("FLOAT32"));
      config.remote_auth_token = json_config.value("remote_auth_token", std::string(""));
      config.remote_health_timeout_ms = json_config.value("remote_health_timeout_ms", 2000);
      config.remote_create_timeout_ms = json_config.value("remote_create_timeout_ms", 10000);
      config.remote_insert_timeout_ms = json_config.value("remote_insert_timeout_ms", 30000);
      config.remote_search_timeout_ms = json_config.value("remote_search_timeout_ms", 10000);
      config.remote_delete_timeout_ms = json_config.value("remote_delete_timeout_ms", 10000);

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);
      config.long_document_threshold = json_config.value("long_document_threshold", 5000);
      config.default_top_k = json_config.value("default_top_k", 3);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value in config: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must look like host:port");
    }
    if (num_threads <= 0) {
      throw std::runtime_error("num_threads must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_enabled && generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty when generation_enabled is true");
    }
    if (ollama_timeout_seconds <= 0) {
      throw std::runtime_error("ollama_timeout_seconds must be greater than 0");
    }
    if (remote_enabled && remote_url.empty()) {
      throw std::runtime_error("remote_url cannot be empty when remote_enabled is true");
    }
    if (remote_enabled && remote_index_name.empty()) {
      throw std::runtime_error("remote_index_name cannot be empty when remote_enabled is true");
    }
    if (remote_health_timeout_ms <= 0 || remote_create_timeout_ms <= 0 ||
        remote_insert_timeout_ms <= 0 || remote_search_timeout_ms <= 0 ||
        remote_delete_timeout_ms <= 0) {
      throw std::runtime_error("remote timeouts must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (long_document_threshold <= 0) {
      throw std::runtime_error("long_document_threshold must be greater than 0");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
  }
};
