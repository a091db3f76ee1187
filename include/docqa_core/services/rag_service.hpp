#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/index/corpus_store.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/answer_composer.hpp"
#include "docqa_core/services/embedding_service.hpp"
#include "docqa_core/services/retriever.hpp"
#include "docqa_core/services/retry_policy.hpp"
#include "docqa_core/types.hpp"

namespace docqa_core {

// incremental: only pending chunks are embedded and appended, positions never move.
// full: every chunk is re-embedded into a fresh index generation.
enum class BuildMode { Incremental, Full };

std::string to_string(BuildMode mode);
// @throw std::invalid_argument for anything but "incremental" or "full"
BuildMode build_mode_from_string(const std::string &str);

enum class OperationStatus { Ok, NoChunks, NotReady, NoQuestion };

std::string to_string(OperationStatus status);

struct RagOptions {
  int chunk_size = 1600;
  int chunk_overlap = 240;
  BuildMode build_mode = BuildMode::Incremental;
  RetryPolicy retry;
};

struct UploadedFile {
  std::string file_name;
  std::string content;
};

struct UploadResult {
  size_t files = 0;
  size_t chunks_added = 0;
  size_t total_chunks = 0;
  std::vector<FileRecord> file_records;
};

struct BuildResult {
  OperationStatus status = OperationStatus::Ok;
  // chunks searchable after the build
  size_t chunks = 0;
  // chunks embedded by this build
  size_t embedded = 0;
  std::string message;
};

struct AskResult {
  OperationStatus status = OperationStatus::Ok;
  std::string answer;
  std::vector<AnswerSource> sources;
};

struct CorpusStatus {
  size_t total_chunks = 0;
  size_t pending_chunks = 0;
  size_t indexed_chunks = 0;
  std::vector<FileRecord> files;
};

/**
 * @class RagService
 * @brief Owns the one corpus and its vector index and exposes the document Q&A
 * operations on them.
 *
 * upload, build and reset run exclusively. ask embeds the question without holding the
 * lock, takes a shared lock only to search the index and resolve the hits, then
 * releases it before the answer is generated, so questions are answered concurrently. build embeds everything first and only then
 * touches the index and the store, so a failed build leaves the previous state intact.
 */
class RagService {
 public:
  RagService(std::shared_ptr<EmbeddingService> embedding_service,
             std::shared_ptr<AnswerComposer> answer_composer,
             std::shared_ptr<ContentExtractorFactory> extractor_factory,
             RagOptions options = {},
             RetrieverOptions retriever_options = {});
  ~RagService() = default;

  RagService(const RagService &) = delete;
  RagService &operator=(const RagService &) = delete;

  // Extracts, chunks and appends every file as pending chunks. Files that yield no
  // text are still recorded, with zero chunks.
  UploadResult upload(const std::vector<UploadedFile> &files);

  // @throw EmbeddingProviderError, DimensionMismatch; state is unchanged on failure
  BuildResult build();

  // @throw EmbeddingProviderError, CompletionProviderError, DimensionMismatch when the
  // question embedding does not match the indexed vectors
  AskResult ask(const std::string &question, std::optional<int> top_k = std::nullopt);

  // Back to the freshly constructed state
  void reset();

  CorpusStatus status() const;

  const RagOptions &options() const {
    return options_;
  }

 private:
  BuildResult build_incremental();
  BuildResult build_full();

  std::shared_ptr<EmbeddingService> embedding_service_;
  std::shared_ptr<AnswerComposer> answer_composer_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  RagOptions options_;

  mutable std::shared_mutex mutex_;
  CorpusStore corpus_store_;
  VectorIndex vector_index_;
  // Holds references to the two members above
  Retriever retriever_;
};

}  // namespace docqa_core
