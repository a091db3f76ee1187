#pragma once

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

class CompletionProviderError : public std::exception {
 public:
  explicit CompletionProviderError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A ranked chunk as shown to the caller. id is the citation number used in the answer.
struct AnswerSource {
  int id = 0;
  ChunkId chunk_id = 0;
  std::string file;
  std::string preview;
  float score = 0.0f;
};

struct ComposedAnswer {
  std::string answer;
  std::vector<AnswerSource> sources;
};

/**
 * @class AnswerComposer
 * @brief Produces a cited answer from a question and its ranked context chunks.
 *
 * Context entry i (1-based) is labelled "[i] (file)" and the model is asked to cite
 * with the same markers. Markers outside 1..sources.size() are removed from the
 * returned answer so every remaining citation resolves to a source.
 */
class AnswerComposer {
 public:
  AnswerComposer(std::shared_ptr<OllamaClient> ollama_client, float temperature = 0.2f);
  virtual ~AnswerComposer() = default;

  // @throw CompletionProviderError on provider failure or an empty completion
  virtual ComposedAnswer compose_answer(const std::string &question,
                                        const std::vector<QueryResult> &ranked_chunks);

  static std::string build_context(const std::vector<QueryResult> &ranked_chunks);
  static std::string build_user_prompt(const std::string &question,
                                       const std::vector<QueryResult> &ranked_chunks);
  static std::string strip_invalid_citations(const std::string &answer, size_t source_count);
  static std::vector<AnswerSource> to_sources(const std::vector<QueryResult> &ranked_chunks);

  static const std::string &system_prompt();
  static const std::string &insufficient_context_answer();

  float temperature() const {
    return temperature_;
  }

 private:
  std::shared_ptr<OllamaClient> ollama_client_;
  float temperature_;
};

}  // namespace docqa_core
