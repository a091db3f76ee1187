#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "docqa_api/json_mapping.hpp"

namespace docqa_core {

TEST(JsonMappingTest, AskResultCarriesAnswerAndSources) {
  AskResult result;
  result.status = OperationStatus::Ok;
  result.answer = "Blue [1].";
  result.sources.push_back(
      {.id = 1, .chunk_id = 7, .file = "sky.txt", .preview = "The sky...", .score = 0.5f});

  nlohmann::json j = result;

  EXPECT_EQ(j["status"], "ok");
  EXPECT_EQ(j["answer"], "Blue [1].");
  ASSERT_EQ(j["sources"].size(), 1u);
  EXPECT_EQ(j["sources"][0]["id"], 1);
  EXPECT_EQ(j["sources"][0]["chunk_id"], 7);
  EXPECT_EQ(j["sources"][0]["file"], "sky.txt");
  EXPECT_EQ(j["sources"][0]["preview"], "The sky...");
  EXPECT_FLOAT_EQ(j["sources"][0]["score"].get<float>(), 0.5f);
}

TEST(JsonMappingTest, NoQuestionCarriesOnlyStatus) {
  AskResult result;
  result.status = OperationStatus::NoQuestion;

  nlohmann::json j = result;

  EXPECT_EQ(j, (nlohmann::json{{"status", "no_question"}}));
}

TEST(JsonMappingTest, NotReadyKeepsEmptySources) {
  AskResult result;
  result.status = OperationStatus::NotReady;
  result.answer = "not yet";

  nlohmann::json j = result;

  EXPECT_EQ(j["status"], "not_ready");
  EXPECT_TRUE(j["sources"].is_array());
  EXPECT_TRUE(j["sources"].empty());
}

TEST(JsonMappingTest, BuildResultOmitsEmptyMessage) {
  nlohmann::json ok = BuildResult{.status = OperationStatus::Ok, .chunks = 3, .embedded = 1};
  EXPECT_EQ(ok["status"], "ok");
  EXPECT_EQ(ok["chunks"], 3);
  EXPECT_EQ(ok["embedded"], 1);
  EXPECT_FALSE(ok.contains("message"));

  nlohmann::json empty = BuildResult{.status = OperationStatus::NoChunks, .message = "Upload first"};
  EXPECT_EQ(empty["status"], "no_chunks");
  EXPECT_EQ(empty["message"], "Upload first");
}

TEST(JsonMappingTest, UploadResultAndStatusListFiles) {
  FileRecord record{.file = "a.md", .file_type = FileType::Markdown, .content_hash = "abc",
                    .size_bytes = 12, .chunk_count = 1};

  nlohmann::json upload = UploadResult{.files = 1, .chunks_added = 1, .total_chunks = 4,
                                       .file_records = {record}};
  EXPECT_EQ(upload["status"], "ok");
  EXPECT_EQ(upload["files"], 1);
  EXPECT_EQ(upload["chunks_added"], 1);
  EXPECT_EQ(upload["total_chunks"], 4);
  EXPECT_EQ(upload["file_records"][0]["file_type"], "Markdown");

  nlohmann::json status = CorpusStatus{.total_chunks = 4, .pending_chunks = 1,
                                       .indexed_chunks = 3, .files = {record}};
  EXPECT_EQ(status["pending_chunks"], 1);
  EXPECT_EQ(status["indexed_chunks"], 3);
  EXPECT_EQ(status["files"][0]["content_hash"], "abc");
  EXPECT_EQ(status["files"][0]["size_bytes"], 12);
}

}  // namespace docqa_core
