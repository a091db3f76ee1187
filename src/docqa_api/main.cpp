#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/answer_composer.hpp"
#include "docqa_core/services/embedding_service.hpp"
#include "docqa_core/services/rag_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char **argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "docqarc.json";
    docqa_api::Config config = docqa_api::Config::from_file(config_path);

    std::cout << "Starting DocQA API Server..." << std::endl;
    std::cout << "Config File: " << config_path << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chat Model: " << config.chat_model << std::endl;
    std::cout << "Chunking: " << config.chunk_size << " code points, " << config.chunk_overlap
              << " overlap" << std::endl;
    std::cout << "Build Mode: " << config.build_mode << std::endl;

    // Initialize core components
    docqa_core::OllamaSettings ollama_settings;
    ollama_settings.url = config.ollama_url;
    ollama_settings.embedding_model = config.embedding_model;
    ollama_settings.chat_model = config.chat_model;
    ollama_settings.timeout_seconds = config.provider_timeout_seconds;
    auto ollama_client = std::make_shared<docqa_core::OllamaClient>(ollama_settings);
    if (!ollama_client->is_server_available()) {
      std::cerr << "Warning: Ollama server at " << config.ollama_url
                << " is not reachable. Build and ask will fail until it is." << std::endl;
    }

    auto embedding_service = std::make_shared<docqa_core::EmbeddingService>(
        ollama_client, static_cast<size_t>(config.embedding_batch_size));
    auto answer_composer =
        std::make_shared<docqa_core::AnswerComposer>(ollama_client, config.temperature);
    auto extractor_factory = std::make_shared<docqa_core::ContentExtractorFactory>();

    docqa_core::RagOptions rag_options;
    rag_options.chunk_size = config.chunk_size;
    rag_options.chunk_overlap = config.chunk_overlap;
    rag_options.build_mode = docqa_core::build_mode_from_string(config.build_mode);
    rag_options.retry.max_attempts = config.provider_max_attempts;
    rag_options.retry.backoff_ms = config.provider_retry_backoff_ms;

    docqa_core::RetrieverOptions retriever_options;
    retriever_options.default_top_k = config.default_top_k;
    retriever_options.max_top_k = config.max_top_k;
    retriever_options.preview_length = static_cast<size_t>(config.preview_length);

    auto rag_service = std::make_shared<docqa_core::RagService>(
        embedding_service, answer_composer, extractor_factory, rag_options, retriever_options);

    docqa_api::Server server(config.host(), config.port(), config.server_threads,
                             config.cors_allow_origin);
    docqa_api::Routes routes(rag_service);
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

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Releasing the in-memory corpus..." << std::endl;
    rag_service->reset();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
