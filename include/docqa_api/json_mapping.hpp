#pragma once

#include <nlohmann/json.hpp>

#include "docqa_core/services/answer_composer.hpp"
#include "docqa_core/services/rag_service.hpp"
#include "docqa_core/types/file.hpp"

// JSON shapes of the HTTP responses. Declared in the namespace of the mapped types so
// nlohmann::json finds them by argument-dependent lookup.
namespace docqa_core {

void to_json(nlohmann::json &j, const FileRecord &record);
void to_json(nlohmann::json &j, const AnswerSource &source);
void to_json(nlohmann::json &j, const UploadResult &result);
void to_json(nlohmann::json &j, const BuildResult &result);
void to_json(nlohmann::json &j, const AskResult &result);
void to_json(nlohmann::json &j, const CorpusStatus &status);

}  // namespace docqa_core
