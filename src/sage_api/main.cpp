#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "sage_api/config.hpp"
#include "sage_api/routes.hpp"
#include "sage_api/server.hpp"
#include "sage_core/llm/ollama_client.hpp"
#include "sage_core/remote/http_transport.hpp"
#include "sage_core/remote/remote_index_client.hpp"
#include "sage_core/services/retriever.hpp"
#include "sage_core/text/chunker.hpp"
#include "sage_core/vector_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main() {
  try {
    const char *config_env = std::getenv("SAGE_CONFIG");
    Config config = Config::from_file(config_env ? config_env : "sagerc.json");

    std::cout << "Starting Sage API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Answer Generation: "
              << (config.generation_enabled ? config.generation_model : std::string("disabled"))
              << std::endl;
    std::cout << "Remote Index: "
              << (config.remote_enabled ? config.remote_url + " (" + config.remote_index_name + ")"
                                        : std::string("disabled"))
              << std::endl;

    // Initialize core components
    auto ollama_client = std::make_shared<sage_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.generation_model,
        config.ollama_timeout_seconds);

    std::shared_ptr<sage_core::RemoteIndexClient> remote_client;
    if (config.remote_enabled) {
      sage_core::RemoteTimeouts timeouts;
      timeouts.health = std::chrono::milliseconds(config.remote_health_timeout_ms);
      timeouts.create = std::chrono::milliseconds(config.remote_create_timeout_ms);
      timeouts.insert = std::chrono::milliseconds(config.remote_insert_timeout_ms);
      timeouts.search = std::chrono::milliseconds(config.remote_search_timeout_ms);
      timeouts.remove = std::chrono::milliseconds(config.remote_delete_timeout_ms);
      remote_client = std::make_shared<sage_core::RemoteIndexClient>(
          config.remote_url, std::make_shared<sage_core::CurlHttpTransport>(), timeouts,
          config.remote_auth_token);
    }

    // The embedding model decides the index dimension for the lifetime of the store
    auto vector_store = std::make_shared<sage_core::VectorStore>(
        ollama_client->dimension(), remote_client, config.remote_index_name,
        config.remote_quantization);

    std::shared_ptr<sage_core::AnswerGenerator> answer_generator;
    if (config.generation_enabled) {
      answer_generator = ollama_client;
    }
    auto retriever =
        std::make_shared<sage_core::Retriever>(ollama_client, vector_store, answer_generator);

    sage_core::TextChunker chunker(static_cast<size_t>(config.chunk_size),
                                   static_cast<size_t>(config.chunk_overlap),
                                   static_cast<size_t>(config.long_document_threshold));

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    sage_api::Server server(host, port, config.num_threads);
    sage_api::Routes routes(retriever, chunker, static_cast<size_t>(config.default_top_k));
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "\nShutdown signal received. Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
