#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include <nlohmann/json.hpp>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_core/services/rag_service.hpp"

namespace docqa_api {

using docqa_tests::MockOllamaClient;
using docqa_tests::TestUtilities;
using ::testing::_;
using ::testing::Return;

class RoutesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_client_ = std::make_shared<::testing::NiceMock<MockOllamaClient>>();
    TestUtilities::use_bag_of_words_embeddings(*mock_client_);
    ON_CALL(*mock_client_, chat(_, _, _)).WillByDefault(Return("Blue [1]."));

    docqa_core::RagOptions options;
    options.chunk_size = 20;
    options.chunk_overlap = 5;
    rag_service_ = std::make_shared<docqa_core::RagService>(
        std::make_shared<docqa_core::EmbeddingService>(mock_client_, 256),
        std::make_shared<docqa_core::AnswerComposer>(mock_client_, 0.2f),
        std::make_shared<docqa_core::ContentExtractorFactory>(), options);
    routes_ = std::make_unique<Routes>(rag_service_);
  }

  static crow::request json_request(const std::string& body) {
    crow::request req;
    req.body = body;
    req.add_header("Content-Type", "application/json");
    return req;
  }

  static crow::request multipart_request(const std::string& boundary, const std::string& body) {
    crow::request req;
    req.body = body;
    req.add_header("Content-Type", "multipart/form-data; boundary=" + boundary);
    return req;
  }

  static std::string multipart_part(const std::string& boundary,
                                    const std::string& disposition,
                                    const std::string& content) {
    return "--" + boundary + "\r\nContent-Disposition: form-data; " + disposition +
           "\r\nContent-Type: application/octet-stream\r\n\r\n" + content + "\r\n";
  }

  void upload_sky() {
    rag_service_->upload({{.file_name = "sky.txt",
                           .content = "The sky is blue. Grass is green."}});
  }

  std::shared_ptr<::testing::NiceMock<MockOllamaClient>> mock_client_;
  std::shared_ptr<docqa_core::RagService> rag_service_;
  std::unique_ptr<Routes> routes_;
};

TEST_F(RoutesTest, HealthCheckReportsHealthy) {
  crow::response res = routes_->handle_health_check(crow::request());

  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(nlohmann::json::parse(res.body)["status"], "healthy");
}

TEST_F(RoutesTest, AskWithMalformedJsonIs400) {
  crow::response res = routes_->handle_ask(json_request("{ question:"));

  EXPECT_EQ(res.code, 400);
  auto body = nlohmann::json::parse(res.body);
  EXPECT_EQ(body["status"], "error");
  EXPECT_FALSE(body["error"].get<std::string>().empty());
}

TEST_F(RoutesTest, AskWithNonIntegerTopKIs400) {
  upload_sky();
  rag_service_->build();

  crow::response res = routes_->handle_ask(json_request(R"({"question": "sky", "top_k": "many"})"));

  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, AskBeforeBuildIsNotReady) {
  crow::response res = routes_->handle_ask(json_request(R"({"question": "What color?"})"));

  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(nlohmann::json::parse(res.body)["status"], "not_ready");
}

TEST_F(RoutesTest, AskAfterBuildReturnsAnswer) {
  upload_sky();
  rag_service_->build();

  crow::response res =
      routes_->handle_ask(json_request(R"({"question": "What color is the sky?", "top_k": 1})"));

  ASSERT_EQ(res.code, 200);
  auto body = nlohmann::json::parse(res.body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["answer"], "Blue [1].");
  ASSERT_EQ(body["sources"].size(), 1u);
  EXPECT_EQ(body["sources"][0]["id"], 1);
}

TEST_F(RoutesTest, MissingQuestionIsNoQuestion) {
  upload_sky();
  rag_service_->build();

  crow::response res = routes_->handle_ask(json_request("{}"));

  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(nlohmann::json::parse(res.body)["status"], "no_question");
}

TEST_F(RoutesTest, BuildOnEmptyCorpusReportsNoChunks) {
  crow::response res = routes_->handle_build(crow::request());

  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(nlohmann::json::parse(res.body)["status"], "no_chunks");
}

TEST_F(RoutesTest, ProviderFailureIs502) {
  upload_sky();
  EXPECT_CALL(*mock_client_, get_embeddings(_))
      .WillOnce(::testing::Throw(docqa_core::OllamaError("connection refused")));

  crow::response res = routes_->handle_build(crow::request());

  EXPECT_EQ(res.code, 502);
  EXPECT_EQ(nlohmann::json::parse(res.body)["status"], "error");
}

TEST_F(RoutesTest, UploadRequiresMultipart) {
  crow::response res = routes_->handle_upload(json_request("{}"));

  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, MultipartUploadTakesOnlyNamedFileParts) {
  const std::string boundary = "docqa-boundary-7MA4YWxk";
  const std::string body =
      multipart_part(boundary, R"(name="files"; filename="sky.txt")",
                     "The sky is blue. Grass is green.") +
      multipart_part(boundary, R"(name="files"; filename="roses.md")", "Roses are red.") +
      multipart_part(boundary, R"(name="note")", "not a file") +
      multipart_part(boundary, R"(name="files")", "a files part without a file name") +
      multipart_part(boundary, R"(name="attachment"; filename="other.txt")", "Other field.") +
      "--" + boundary + "--\r\n";

  crow::response res = routes_->handle_upload(multipart_request(boundary, body));

  ASSERT_EQ(res.code, 200);
  auto json = nlohmann::json::parse(res.body);
  EXPECT_EQ(json["status"], "ok");
  EXPECT_EQ(json["files"], 2);
  EXPECT_EQ(json["chunks_added"], 3);
  EXPECT_EQ(json["total_chunks"], 3);
  ASSERT_EQ(json["file_records"].size(), 2u);
  EXPECT_EQ(json["file_records"][0]["file"], "sky.txt");
  EXPECT_EQ(json["file_records"][1]["file"], "roses.md");
  EXPECT_EQ(json["file_records"][1]["file_type"], "Markdown");

  EXPECT_EQ(rag_service_->status().files.size(), 2u);
}

TEST_F(RoutesTest, MultipartWithoutFilesPartIs400) {
  const std::string boundary = "docqa-boundary-empty";
  const std::string body =
      multipart_part(boundary, R"(name="note")", "no files here") + "--" + boundary + "--\r\n";

  crow::response res = routes_->handle_upload(multipart_request(boundary, body));

  EXPECT_EQ(res.code, 400);
}

TEST_F(RoutesTest, UnreadableDocumentUploadIs400) {
  const std::string boundary = "docqa-boundary-pdf";
  const std::string body =
      multipart_part(boundary, R"(name="files"; filename="broken.pdf")", "%PDF-1.7 truncated") +
      "--" + boundary + "--\r\n";

  crow::response res = routes_->handle_upload(multipart_request(boundary, body));

  EXPECT_EQ(res.code, 400);
  EXPECT_EQ(nlohmann::json::parse(res.body)["status"], "error");
  EXPECT_EQ(rag_service_->status().total_chunks, 0u);
}

TEST_F(RoutesTest, QueryDimensionMismatchIs502) {
  upload_sky();
  rag_service_->build();
  EXPECT_CALL(*mock_client_, get_embeddings(::testing::ElementsAre("What color is the sky?")))
      .WillOnce(Return(std::vector<std::vector<float>>{{1.0f, 0.0f, 0.0f}}));
  EXPECT_CALL(*mock_client_, chat(_, _, _)).Times(0);

  crow::response res =
      routes_->handle_ask(json_request(R"({"question": "What color is the sky?"})"));

  EXPECT_EQ(res.code, 502);
  auto body = nlohmann::json::parse(res.body);
  EXPECT_EQ(body["status"], "error");
  EXPECT_NE(body["error"].get<std::string>().find("rebuild"), std::string::npos);
}

TEST_F(RoutesTest, ResetAndStatus) {
  upload_sky();

  auto status = nlohmann::json::parse(routes_->handle_status(crow::request()).body);
  EXPECT_EQ(status["total_chunks"], 2);
  EXPECT_EQ(status["pending_chunks"], 2);

  crow::response reset = routes_->handle_reset(crow::request());
  EXPECT_EQ(reset.code, 200);
  EXPECT_EQ(nlohmann::json::parse(reset.body)["status"], "ok");

  status = nlohmann::json::parse(routes_->handle_status(crow::request()).body);
  EXPECT_EQ(status["total_chunks"], 0);
}

}  // namespace docqa_api
