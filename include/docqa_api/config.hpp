#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace docqa_api {

class Config {
 public:
  // HTTP server
  std::string api_base_url;
  int server_threads;
  std::string cors_allow_origin;

  // Ollama provider
  std::string ollama_url;
  std::string embedding_model;
  std::string chat_model;
  int provider_timeout_seconds;
  int provider_max_attempts;
  int provider_retry_backoff_ms;
  int embedding_batch_size;

  // Chunking and retrieval
  int chunk_size;
  int chunk_overlap;
  int default_top_k;
  int max_top_k;
  int preview_length;
  float temperature;
  std::string build_mode;

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
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
      config.server_threads = json_config.value("server_threads", 4);
      config.cors_allow_origin = json_config.value("cors_allow_origin", std::string("*"));

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.chat_model = json_config.value("chat_model", std::string("llama3.1:8b"));
      config.provider_timeout_seconds = json_config.value("provider_timeout_seconds", 120);
      config.provider_max_attempts = json_config.value("provider_max_attempts", 1);
      config.provider_retry_backoff_ms = json_config.value("provider_retry_backoff_ms", 500);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 256);

      config.chunk_size = json_config.value("chunk_size", 1600);
      config.chunk_overlap = json_config.value("chunk_overlap", 240);
      config.default_top_k = json_config.value("default_top_k", 6);
      config.max_top_k = json_config.value("max_top_k", 20);
      config.preview_length = json_config.value("preview_length", 300);
      config.temperature = json_config.value("temperature", 0.2f);
      config.build_mode = json_config.value("build_mode", std::string("incremental"));
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.rfind(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.rfind(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw std::runtime_error("api_base_url must look like host:port");
    }
    if (server_threads <= 0) {
      throw std::runtime_error("server_threads must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (chat_model.empty()) {
      throw std::runtime_error("chat_model cannot be empty");
    }
    if (provider_timeout_seconds <= 0) {
      throw std::runtime_error("provider_timeout_seconds must be greater than 0");
    }
    if (provider_max_attempts < 1) {
      throw std::runtime_error("provider_max_attempts must be at least 1");
    }
    if (provider_retry_backoff_ms < 0) {
      throw std::runtime_error("provider_retry_backoff_ms cannot be negative");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (max_top_k < 1) {
      throw std::runtime_error("max_top_k must be at least 1");
    }
    if (default_top_k < 1 || default_top_k > max_top_k) {
      throw std::runtime_error("default_top_k must be between 1 and max_top_k");
    }
    if (preview_length <= 0) {
      throw std::runtime_error("preview_length must be greater than 0");
    }
    if (temperature < 0.0f || temperature > 2.0f) {
      throw std::runtime_error("temperature must be between 0 and 2");
    }
    if (build_mode != "incremental" && build_mode != "full") {
      throw std::runtime_error("build_mode must be 'incremental' or 'full'");
    }
  }
};

}  // namespace docqa_api
