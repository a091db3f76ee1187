#include "docqa_core/services/answer_composer.hpp"

#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {

AnswerComposer::AnswerComposer(std::shared_ptr<OllamaClient> ollama_client, float temperature)
    : ollama_client_(std::move(ollama_client)), temperature_(temperature) {
  if (!ollama_client_) {
    throw std::invalid_argument("AnswerComposer requires an Ollama client");
  }
}

const std::string &AnswerComposer::system_prompt() {
  static const std::string prompt =
      "You answer questions about a collection of documents. "
      "Use only the numbered context passages supplied with the question. "
      "When the passages do not contain the answer, reply that there is not enough "
      "information to answer. "
      "Cite the passages you rely on with their bracketed number, for example [2].";
  return prompt;
}

const std::string &AnswerComposer::insufficient_context_answer() {
  static const std::string answer =
      "I don't have enough information to answer. Please upload documents and build the "
      "index.";
  return answer;
}

ComposedAnswer AnswerComposer::compose_answer(const std::string &question,
                                              const std::vector<QueryResult> &ranked_chunks) {
  ComposedAnswer result;
  result.sources = to_sources(ranked_chunks);

  if (ranked_chunks.empty()) {
    result.answer = insufficient_context_answer();
    return result;
  }

  std::string completion;
  try {
    completion = ollama_client_->chat(system_prompt(), build_user_prompt(question, ranked_chunks),
                                      temperature_);
  } catch (const std::exception &e) {
    throw CompletionProviderError(std::string("Answer generation failed: ") + e.what());
  }

  completion = text::trim(completion);
  if (completion.empty()) {
    throw CompletionProviderError("Answer generation returned an empty completion");
  }

  result.answer = strip_invalid_citations(completion, result.sources.size());
  return result;
}

std::string AnswerComposer::build_context(const std::vector<QueryResult> &ranked_chunks) {
  std::ostringstream context;
  for (size_t i = 0; i < ranked_chunks.size(); ++i) {
    if (i > 0) {
      context << "\n\n";
    }
    context << "[" << (i + 1) << "] (" << ranked_chunks[i].file << ")\n" << ranked_chunks[i].text;
  }
  return context.str();
}

std::string AnswerComposer::build_user_prompt(const std::string &question,
                                              const std::vector<QueryResult> &ranked_chunks) {
  std::ostringstream prompt;
  prompt << "Question:\n" << question << "\n\n"
         << "Context passages:\n" << build_context(ranked_chunks) << "\n\n"
         << "Keep the answer short and precise. When several passages support it, cite each "
            "one, like [1][3].";
  return prompt.str();
}

std::string AnswerComposer::strip_invalid_citations(const std::string &answer,
                                                    size_t source_count) {
  static const std::regex marker_regex(R"(\[(\d+)\])");

  std::string cleaned;
  cleaned.reserve(answer.size());
  auto last = answer.cbegin();
  for (std::sregex_iterator it(answer.begin(), answer.end(), marker_regex), end; it != end;
       ++it) {
    const std::smatch &match = *it;
    cleaned.append(last, match[0].first);
    const std::string digits = match[1].str();
    // anything too long to parse is out of range anyway
    bool valid = digits.size() <= 9;
    if (valid) {
      const unsigned long number = std::stoul(digits);
      valid = number >= 1 && number <= source_count;
    }
    if (valid) {
      cleaned.append(match[0].first, match[0].second);
    } else {
      std::cerr << "Dropping citation " << match[0].str() << " with " << source_count
                << " sources" << std::endl;
    }
    last = match[0].second;
  }
  cleaned.append(last, answer.cend());
  return cleaned;
}

std::vector<AnswerSource> AnswerComposer::to_sources(const std::vector<QueryResult> &ranked_chunks) {
  std::vector<AnswerSource> sources;
  sources.reserve(ranked_chunks.size());
  for (size_t i = 0; i < ranked_chunks.size(); ++i) {
    const QueryResult &chunk = ranked_chunks[i];
    sources.push_back({.id = static_cast<int>(i + 1),
                       .chunk_id = chunk.chunk_id,
                       .file = chunk.file,
                       .preview = chunk.preview,
                       .score = chunk.score});
  }
  return sources;
}

}  // namespace docqa_core
