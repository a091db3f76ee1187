#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "common/utilities_test.hpp"
#include "docqa_core/extractors/pdf_extractor.hpp"

namespace docqa_core {

using docqa_tests::TestUtilities;
using ::testing::HasSubstr;

class PdfExtractorTest : public ::testing::Test {
 protected:
  PdfExtractor extractor_;
};

TEST_F(PdfExtractorTest, CanHandle_PdfFiles) {
  EXPECT_TRUE(extractor_.can_handle("paper.pdf"));
  EXPECT_TRUE(extractor_.can_handle("SCAN.PDF"));
  EXPECT_FALSE(extractor_.can_handle("paper.pdf.txt"));
  EXPECT_FALSE(extractor_.can_handle("letter.docx"));
  EXPECT_EQ(extractor_.get_file_type(), FileType::PDF);
}

TEST_F(PdfExtractorTest, ExtractsPageText) {
  const std::string text = extractor_.extract_text(TestUtilities::make_pdf({"The sky is blue"}));

  EXPECT_THAT(text, HasSubstr("The sky is blue"));
}

TEST_F(PdfExtractorTest, JoinsPagesWithBlankLine) {
  const std::string text =
      extractor_.extract_text(TestUtilities::make_pdf({"First page", "Second page"}));

  const size_t first = text.find("First page");
  const size_t second = text.find("Second page");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  ASSERT_LT(first, second);
  EXPECT_NE(text.substr(first, second - first).find("\n\n"), std::string::npos);
}

TEST_F(PdfExtractorTest, RejectsBytesThatAreNotPdf) {
  EXPECT_THROW(extractor_.extract_text("%PDF-1.7 truncated"), ContentExtractorError);
  EXPECT_THROW(extractor_.extract_text(""), ContentExtractorError);
}

}  // namespace docqa_core
