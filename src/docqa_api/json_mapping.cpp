#include "docqa_api/json_mapping.hpp"

namespace docqa_core {

void to_json(nlohmann::json &j, const FileRecord &record) {
  j = nlohmann::json{{"file", record.file},
                     {"file_type", to_string(record.file_type)},
                     {"content_hash", record.content_hash},
                     {"size_bytes", record.size_bytes},
                     {"chunk_count", record.chunk_count}};
}

void to_json(nlohmann::json &j, const AnswerSource &source) {
  j = nlohmann::json{{"id", source.id},
                     {"chunk_id", source.chunk_id},
                     {"file", source.file},
                     {"preview", source.preview},
                     {"score", source.score}};
}

void to_json(nlohmann::json &j, const UploadResult &result) {
  j = nlohmann::json{{"status", "ok"},
                     {"files", result.files},
                     {"chunks_added", result.chunks_added},
                     {"total_chunks", result.total_chunks},
                     {"file_records", result.file_records}};
}

void to_json(nlohmann::json &j, const BuildResult &result) {
  j = nlohmann::json{{"status", to_string(result.status)},
                     {"chunks", result.chunks},
                     {"embedded", result.embedded}};
  if (!result.message.empty()) {
    j["message"] = result.message;
  }
}

void to_json(nlohmann::json &j, const AskResult &result) {
  j = nlohmann::json{{"status", to_string(result.status)}};
  if (result.status == OperationStatus::NoQuestion) {
    return;
  }
  j["answer"] = result.answer;
  j["sources"] = result.sources;
}

void to_json(nlohmann::json &j, const CorpusStatus &status) {
  j = nlohmann::json{{"status", "ok"},
                     {"total_chunks", status.total_chunks},
                     {"pending_chunks", status.pending_chunks},
                     {"indexed_chunks", status.indexed_chunks},
                     {"files", status.files}};
}

}  // namespace docqa_core
