#include <gtest/gtest.h>

#include <stdexcept>

#include "docqa_core/index/corpus_store.hpp"

namespace docqa_core {

class CorpusStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.append("a.txt", "alpha");
    store_.append("a.txt", "beta");
    store_.append("b.md", "gamma");
  }

  CorpusStore store_;
};

TEST_F(CorpusStoreTest, AppendAssignsSequentialIds) {
  Chunk next = store_.append("c.txt", "delta");

  EXPECT_EQ(next.id, 3);
  EXPECT_EQ(next.file, "c.txt");
  EXPECT_FALSE(next.is_indexed());
  EXPECT_EQ(store_.size(), 4u);
  EXPECT_EQ(store_.get(1).text, "beta");
}

TEST_F(CorpusStoreTest, NewChunksArePending) {
  EXPECT_EQ(store_.pending_count(), 3u);
  EXPECT_EQ(store_.indexed_count(), 0u);
  auto pending = store_.all_pending();
  ASSERT_EQ(pending.size(), 3u);
  EXPECT_EQ(pending[0].id, 0);
  EXPECT_EQ(pending[2].id, 2);
}

TEST_F(CorpusStoreTest, MarkIndexedMapsPositionBackToChunk) {
  store_.mark_indexed(2, 0);
  store_.mark_indexed(0, 1);

  EXPECT_EQ(store_.chunk_at(0).text, "gamma");
  EXPECT_EQ(store_.chunk_at(1).text, "alpha");
  EXPECT_EQ(store_.get(2).vector_position, 0);
  EXPECT_EQ(store_.indexed_count(), 2u);

  auto pending = store_.all_pending();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].id, 1);
}

TEST_F(CorpusStoreTest, ChunkCannotBeIndexedTwice) {
  store_.mark_indexed(0, 0);
  EXPECT_THROW(store_.mark_indexed(0, 1), std::logic_error);
}

TEST_F(CorpusStoreTest, PositionsMustBeDense) {
  EXPECT_THROW(store_.mark_indexed(0, 1), std::logic_error);
  store_.mark_indexed(0, 0);
  EXPECT_THROW(store_.mark_indexed(1, 0), std::logic_error);
}

TEST_F(CorpusStoreTest, UnknownIdsAndPositionsThrow) {
  EXPECT_THROW(store_.get(3), ChunkNotFound);
  EXPECT_THROW(store_.get(-1), ChunkNotFound);
  EXPECT_THROW(store_.mark_indexed(7, 0), ChunkNotFound);
  EXPECT_THROW(store_.chunk_at(0), ChunkNotFound);
}

TEST_F(CorpusStoreTest, BeginGenerationForgetsPositionsButKeepsChunks) {
  store_.mark_indexed(0, 0);
  store_.mark_indexed(1, 1);

  store_.begin_generation(4);

  EXPECT_EQ(store_.generation(), 4u);
  EXPECT_EQ(store_.size(), 3u);
  EXPECT_EQ(store_.indexed_count(), 0u);
  EXPECT_FALSE(store_.get(0).is_indexed());
  EXPECT_THROW(store_.chunk_at(0), ChunkNotFound);
  store_.mark_indexed(1, 0);
  EXPECT_EQ(store_.chunk_at(0).text, "beta");
}

TEST_F(CorpusStoreTest, ClearRestartsIdsAndDropsFiles) {
  store_.record_file({.file = "a.txt", .file_type = FileType::Text, .content_hash = "h",
                      .size_bytes = 10, .chunk_count = 2});
  store_.mark_indexed(0, 0);

  store_.clear();

  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(store_.indexed_count(), 0u);
  EXPECT_TRUE(store_.files().empty());
  EXPECT_EQ(store_.append("new.txt", "again").id, 0);
}

TEST_F(CorpusStoreTest, RecordsFilesInUploadOrder) {
  store_.record_file({.file = "a.txt", .file_type = FileType::Text});
  store_.record_file({.file = "b.md", .file_type = FileType::Markdown});

  ASSERT_EQ(store_.files().size(), 2u);
  EXPECT_EQ(store_.files()[0].file, "a.txt");
  EXPECT_EQ(store_.files()[1].file_type, FileType::Markdown);
}

}  // namespace docqa_core
