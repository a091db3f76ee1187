#include "docqa_core/services/rag_service.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/text/utf8_text.hpp"

namespace docqa_core {

std::string to_string(BuildMode mode) {
  switch (mode) {
    case BuildMode::Incremental:
      return "incremental";
    case BuildMode::Full:
      return "full";
  }
  return "incremental";
}

BuildMode build_mode_from_string(const std::string &str) {
  if (str == "incremental")
    return BuildMode::Incremental;
  if (str == "full")
    return BuildMode::Full;
  throw std::invalid_argument("Unknown build mode '" + str + "' (expected incremental or full)");
}

std::string to_string(OperationStatus status) {
  switch (status) {
    case OperationStatus::NoChunks:
      return "no_chunks";
    case OperationStatus::NotReady:
      return "not_ready";
    case OperationStatus::NoQuestion:
      return "no_question";
    default:
      return "ok";
  }
}

RagService::RagService(std::shared_ptr<EmbeddingService> embedding_service,
                       std::shared_ptr<AnswerComposer> answer_composer,
                       std::shared_ptr<ContentExtractorFactory> extractor_factory,
                       RagOptions options,
                       RetrieverOptions retriever_options)
    : embedding_service_(std::move(embedding_service)),
      answer_composer_(std::move(answer_composer)),
      extractor_factory_(std::move(extractor_factory)),
      options_(options),
      retriever_(embedding_service_, corpus_store_, vector_index_, retriever_options) {
  if (!embedding_service_ || !answer_composer_ || !extractor_factory_) {
    throw std::invalid_argument("RagService requires embedding, answer and extractor services");
  }
  // Reject a bad chunk configuration now rather than on the first upload
  validate_chunk_config(options_.chunk_size, options_.chunk_overlap, " in the service options");
}

UploadResult RagService::upload(const std::vector<UploadedFile> &files) {
  struct PreparedFile {
    FileRecord record;
    std::vector<std::string> chunks;
  };

  // Extraction and chunking need no shared state
  std::vector<PreparedFile> prepared;
  prepared.reserve(files.size());
  for (const auto &file : files) {
    const ContentExtractor &extractor = extractor_factory_->get_extractor_for(file.file_name);
    PreparedFile entry;
    entry.record.file = file.file_name;
    entry.record.file_type = extractor.get_file_type();
    entry.record.content_hash = extractor.compute_content_hash(file.content);
    entry.record.size_bytes = file.content.size();

    const std::string text = extractor.extract_text(file.content);
    if (text::trim(text).empty()) {
      std::cout << "No text extracted from " << file.file_name << " ("
                << to_string(entry.record.file_type) << "), skipping" << std::endl;
    } else {
      entry.chunks = chunk_text(file.file_name, text, options_.chunk_size, options_.chunk_overlap);
    }
    entry.record.chunk_count = entry.chunks.size();
    prepared.push_back(std::move(entry));
  }

  UploadResult result;
  result.files = files.size();

  std::unique_lock lock(mutex_);
  for (auto &entry : prepared) {
    for (const auto &chunk : entry.chunks) {
      corpus_store_.append(entry.record.file, chunk);
    }
    result.chunks_added += entry.chunks.size();
    corpus_store_.record_file(entry.record);
    std::cout << "Uploaded " << entry.record.file << ": " << entry.record.chunk_count
              << " chunks" << std::endl;
    result.file_records.push_back(std::move(entry.record));
  }
  result.total_chunks = corpus_store_.size();
  return result;
}

BuildResult RagService::build() {
  std::unique_lock lock(mutex_);
  if (corpus_store_.size() == 0) {
    std::cout << "Build requested with an empty corpus" << std::endl;
    return {.status = OperationStatus::NoChunks,
            .chunks = 0,
            .embedded = 0,
            .message = "No documents to index. Please upload files and try again."};
  }

  std::cout << "Building index (" << to_string(options_.build_mode) << ") over "
            << corpus_store_.size() << " chunks" << std::endl;
  BuildResult result =
      options_.build_mode == BuildMode::Full ? build_full() : build_incremental();
  std::cout << "Index built: " << result.embedded << " embedded, " << result.chunks
            << " searchable" << std::endl;
  return result;
}

BuildResult RagService::build_incremental() {
  const std::vector<Chunk> pending = corpus_store_.all_pending();
  if (pending.empty()) {
    return {.status = OperationStatus::Ok,
            .chunks = vector_index_.size(),
            .embedded = 0,
            .message = "Index is already up to date."};
  }

  std::vector<std::string> texts;
  texts.reserve(pending.size());
  for (const auto &chunk : pending) {
    texts.push_back(chunk.text);
  }

  auto vectors = with_retry(options_.retry, "Chunk embedding",
                            [&] { return embedding_service_->embed(texts); });

  // Nothing has been modified up to here
  const std::vector<VectorPosition> positions = vector_index_.add(vectors);
  for (size_t i = 0; i < pending.size(); ++i) {
    corpus_store_.mark_indexed(pending[i].id, positions[i]);
  }

  return {.status = OperationStatus::Ok,
          .chunks = vector_index_.size(),
          .embedded = pending.size(),
          .message = ""};
}

BuildResult RagService::build_full() {
  const std::vector<Chunk> chunks = corpus_store_.all();

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text);
  }

  auto vectors = with_retry(options_.retry, "Chunk embedding",
                            [&] { return embedding_service_->embed(texts); });

  const std::vector<VectorPosition> positions = vector_index_.rebuild(vectors);
  corpus_store_.begin_generation(vector_index_.generation());
  for (size_t i = 0; i < chunks.size(); ++i) {
    corpus_store_.mark_indexed(chunks[i].id, positions[i]);
  }

  return {.status = OperationStatus::Ok,
          .chunks = vector_index_.size(),
          .embedded = chunks.size(),
          .message = ""};
}

AskResult RagService::ask(const std::string &question, std::optional<int> top_k) {
  {
    std::shared_lock lock(mutex_);
    if (vector_index_.empty()) {
      return {.status = OperationStatus::NotReady,
              .answer = AnswerComposer::insufficient_context_answer(),
              .sources = {}};
    }
  }
  if (text::trim(question).empty()) {
    return {.status = OperationStatus::NoQuestion, .answer = "", .sources = {}};
  }

  // The provider call and its backoff run unlocked. A reset landing in between leaves
  // an empty index, which retrieve_by_vector reports as IndexNotBuilt.
  const std::vector<float> query_vector = with_retry(
      options_.retry, "Question embedding", [&] { return embedding_service_->embed_one(question); });

  std::vector<QueryResult> ranked;
  {
    std::shared_lock lock(mutex_);
    std::cout << "Answering question with top_k " << retriever_.clamp_top_k(top_k) << std::endl;
    try {
      ranked = retriever_.retrieve_by_vector(query_vector, top_k);
    } catch (const IndexNotBuilt &e) {
      std::cout << e.what() << std::endl;
      return {.status = OperationStatus::NotReady,
              .answer = AnswerComposer::insufficient_context_answer(),
              .sources = {}};
    }
  }

  ComposedAnswer composed = with_retry(options_.retry, "Answer generation", [&] {
    return answer_composer_->compose_answer(question, ranked);
  });
  return {.status = OperationStatus::Ok,
          .answer = std::move(composed.answer),
          .sources = std::move(composed.sources)};
}

void RagService::reset() {
  std::unique_lock lock(mutex_);
  vector_index_.clear();
  corpus_store_.clear();
  corpus_store_.begin_generation(vector_index_.generation());
  std::cout << "Corpus and index reset" << std::endl;
}

CorpusStatus RagService::status() const {
  std::shared_lock lock(mutex_);
  return {.total_chunks = corpus_store_.size(),
          .pending_chunks = corpus_store_.pending_count(),
          .indexed_chunks = corpus_store_.indexed_count(),
          .files = corpus_store_.files()};
}

}  // namespace docqa_core
