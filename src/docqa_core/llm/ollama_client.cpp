#include "docqa_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace docqa_core {

OllamaClient::OllamaClient(const OllamaSettings &settings) : settings_(settings) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // ollama-hpp keeps one global connection; no request is made here
  ollama::setServerURL(settings_.url);
  ollama::setReadTimeout(settings_.timeout_seconds);
  ollama::setWriteTimeout(settings_.timeout_seconds);
}

// The /api/embed endpoint accepts an array input and answers with one vector per item
std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts_to_embed) {
  if (texts_to_embed.empty()) {
    return {};
  }
  try {
    ollama::request request =
        ollama::request::from_embedding(settings_.embedding_model, texts_to_embed.front());
    request["input"] = texts_to_embed;

    ollama::response response = ollama::generate_embeddings(request);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
      throw OllamaError("Response does not contain an embeddings array");
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(json_response["embeddings"].size());
    for (const auto &embedding : json_response["embeddings"]) {
      if (!embedding.is_array()) {
        throw OllamaError("Embedding entry is not an array");
      }
      embeddings.push_back(embedding.get<std::vector<float>>());
    }
    return embeddings;

  } catch (const ollama::exception &e) {
    // Wrap ollama-hpp exceptions in our own exception
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::string OllamaClient::chat(const std::string &system_prompt,
                               const std::string &user_prompt,
                               float temperature) {
  try {
    ollama::request request(ollama::message_type::chat);
    request["model"] = settings_.chat_model;
    request["stream"] = false;
    request["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", system_prompt}},
        {{"role", "user"}, {"content", user_prompt}},
    });
    request["options"] = {{"temperature", temperature}};

    ollama::response response = ollama::chat(request);
    return response.as_simple_string();

  } catch (const ollama::exception &e) {
    throw OllamaError("Chat completion failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed chat response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace docqa_core
