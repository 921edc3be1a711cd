#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "docsearch_core/errors.hpp"
#include "docsearch_core/extractors/content_extractor_factory.hpp"
#include "docsearch_core/services/indexing_service.hpp"
#include "docsearch_core/services/search_service.hpp"

namespace docsearch_core {

using docsearch_tests::MockUtilities::create_search_result;
using testing::_;

class SearchServiceTest : public docsearch_tests::VectorStoreTestBase {
 protected:
  void SetUp() override {
    VectorStoreTestBase::SetUp();

    keyword_provider_ = std::make_shared<docsearch_tests::KeywordEmbeddingProvider>(
        std::vector<std::string>{"cat", "dog", "fish", "bird", "garden", "ocean"});
    embedding_client_ = std::make_shared<EmbeddingClient>(
        keyword_provider_, EmbeddingClientOptions{}, [](std::chrono::milliseconds) {});
    search_service_ = std::make_unique<SearchService>(vector_store_, embedding_client_);
  }

  void TearDown() override {
    search_service_.reset();
    VectorStoreTestBase::TearDown();
  }

  // Stores the text the way the indexing pipeline would
  void index_paragraphs(const std::string& source, const std::vector<std::string>& paragraphs) {
    vector_store_->insert_chunks(source, paragraphs, embedding_client_->embed(paragraphs),
                                 "paragraph");
  }

  std::shared_ptr<docsearch_tests::KeywordEmbeddingProvider> keyword_provider_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::unique_ptr<SearchService> search_service_;
};

TEST_F(SearchServiceTest, MergeResults_RoundRobinKeepsHigherScoreForDuplicates) {
  // Arrange
  std::vector<std::vector<SearchResult>> all_results = {
      {create_search_result("a", 0.9), create_search_result("b", 0.5)},
      {create_search_result("a", 0.95), create_search_result("c", 0.6)}};

  // Act
  auto merged = SearchService::merge_results(all_results, 3);

  // Assert
  ASSERT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged[0].chunk_text, "a");
  EXPECT_DOUBLE_EQ(merged[0].similarity_score, 0.95);
  EXPECT_EQ(merged[1].chunk_text, "b");
  EXPECT_EQ(merged[2].chunk_text, "c");
}

TEST_F(SearchServiceTest, MergeResults_TakesOneItemPerListPerRound) {
  std::vector<std::vector<SearchResult>> all_results = {
      {create_search_result("x1", 0.99), create_search_result("x2", 0.98),
       create_search_result("x3", 0.97)},
      {create_search_result("y1", 0.2), create_search_result("y2", 0.1)}};

  auto merged = SearchService::merge_results(all_results, 3);

  // Not a global top-k: y1 is taken in the first round despite its low score
  ASSERT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged[0].chunk_text, "x1");
  EXPECT_EQ(merged[1].chunk_text, "y1");
  EXPECT_EQ(merged[2].chunk_text, "x2");
}

TEST_F(SearchServiceTest, MergeResults_StopsWhenListsAreExhausted) {
  std::vector<std::vector<SearchResult>> all_results = {{create_search_result("only", 0.4)}, {}};

  auto merged = SearchService::merge_results(all_results, 5);

  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].chunk_text, "only");
}

TEST_F(SearchServiceTest, MergeResults_DuplicateWithLowerScoreKeepsFirst) {
  std::vector<std::vector<SearchResult>> all_results = {
      {create_search_result("a", 0.8, "first.txt")},
      {create_search_result("a", 0.3, "second.txt")}};

  auto merged = SearchService::merge_results(all_results, 5);

  ASSERT_EQ(merged.size(), 1u);
  EXPECT_DOUBLE_EQ(merged[0].similarity_score, 0.8);
  EXPECT_EQ(merged[0].source, "first.txt");
}

TEST_F(SearchServiceTest, Search_EmptyVectorList_ThrowsValidationError) {
  EXPECT_THROW(search_service_->search({}, 5), ValidationError);
}

TEST_F(SearchServiceTest, Search_NonPositiveTopK_ThrowsValidationError) {
  EXPECT_THROW(search_service_->search({{1.0f, 0.0f}}, 0), ValidationError);
}

TEST_F(SearchServiceTest, Search_ZeroVectorQuery_ReturnsNoResults) {
  index_paragraphs("pets.txt", {"cat and dog"});

  auto results = search_service_->search({std::vector<float>(6, 0.0f)}, 5);

  EXPECT_TRUE(results.empty());
}

TEST_F(SearchServiceTest, Search_ZeroVectorIsSkippedButOthersSearched) {
  index_paragraphs("pets.txt", {"cat and dog"});
  auto mock_store = std::make_shared<testing::NiceMock<docsearch_tests::MockVectorStore>>(*db_manager_);
  SearchService service(mock_store, embedding_client_);

  // Only the non-zero vector reaches the store
  EXPECT_CALL(*mock_store, search_similar(_, _, 5)).Times(1);

  auto results = service.search(
      {std::vector<float>(6, 0.0f), keyword_provider_->embed_text("cat")}, 5);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk_text, "cat and dog");
}

TEST_F(SearchServiceTest, Search_StoreFailure_PropagatesDatabaseSearchError) {
  auto mock_store = std::make_shared<testing::NiceMock<docsearch_tests::MockVectorStore>>(*db_manager_);
  SearchService service(mock_store, embedding_client_);
  EXPECT_CALL(*mock_store, search_similar(_, _, _))
      .WillOnce(testing::Throw(DatabaseSearchError("disk I/O error")));

  EXPECT_THROW(service.search({{1.0f, 0.0f}}, 5), DatabaseSearchError);
}

TEST_F(SearchServiceTest, SearchQuery_EndToEndRanksMatchingParagraphFirst) {
  // Arrange
  index_paragraphs("animals.md", {"The cat sat in the garden with another cat.",
                                  "A fish swims in the ocean, far from any fish tank.",
                                  "The bird sang while the dog slept."});

  // Act
  auto results = search_service_->search_query("fish ocean", 3);

  // Assert
  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].chunk_text, "A fish swims in the ocean, far from any fish tank.");
  EXPECT_EQ(results[0].source, "animals.md");
  // Paragraph 1 shares no words with the query
  for (size_t i = 1; i < results.size(); ++i) {
    EXPECT_LT(results[i].similarity_score, results[0].similarity_score);
  }
}

TEST_F(SearchServiceTest, SearchQuery_RanksSecondParagraphOfIndexedDocument) {
  // Arrange
  IndexingService indexing_service(vector_store_, embedding_client_,
                                   std::make_shared<ContentExtractorFactory>());
  IndexResult indexed = indexing_service.index_text(
      "pets.md", "The cat and the dog share a garden.\n\nA fish lives in the ocean.");
  ASSERT_TRUE(indexed.success) << indexed.error_message;
  ASSERT_EQ(indexed.chunk_count, 2u);

  // Act
  auto results = search_service_->search_query("ocean fish", 2);

  // Assert
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk_text, "A fish lives in the ocean.");
  EXPECT_EQ(results[0].source, "pets.md");
  EXPECT_EQ(results[1].chunk_text, "The cat and the dog share a garden.");
  EXPECT_GT(results[0].similarity_score, results[1].similarity_score);
}

TEST_F(SearchServiceTest, SearchQuery_MultiParagraphQueryMergesBothSides) {
  index_paragraphs("animals.md", {"cat garden", "fish ocean", "bird"});

  auto results = search_service_->search_query("cat\n\nocean", 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk_text, "cat garden");
  EXPECT_EQ(results[1].chunk_text, "fish ocean");
}

TEST_F(SearchServiceTest, SearchQuery_BlankQuery_ThrowsInvalidInput) {
  EXPECT_THROW(search_service_->search_query("   ", 5), InvalidInputError);
}

TEST_F(SearchServiceTest, SearchAndFormat_ReturnsFormattedResults) {
  index_paragraphs("pets.txt", {"cat and dog"});

  std::string output = search_service_->search_and_format("cat", 5);

  EXPECT_THAT(output, testing::HasSubstr("Search Results (1 results):"));
  EXPECT_THAT(output, testing::HasSubstr("1. Source: pets.txt | Similarity: 70.7%"));
}

TEST_F(SearchServiceTest, SearchAndFormat_FailureBecomesMessage) {
  std::string output = search_service_->search_and_format("", 5);

  EXPECT_EQ(output.rfind("Search failed:", 0), 0u);
}

TEST_F(SearchServiceTest, SearchAndFormat_EmbeddingFailureBecomesMessage) {
  auto failing_provider =
      std::make_shared<testing::NiceMock<docsearch_tests::MockEmbeddingProvider>>();
  ON_CALL(*failing_provider, embed_batch(_))
      .WillByDefault(testing::Return(BatchEmbeddingResult::failure_response("quota exceeded")));
  auto client = std::make_shared<EmbeddingClient>(failing_provider, EmbeddingClientOptions{},
                                                  [](std::chrono::milliseconds) {});
  SearchService service(vector_store_, client);

  std::string output = service.search_and_format("cat", 5);

  EXPECT_THAT(output, testing::StartsWith("Search failed: "));
  EXPECT_THAT(output, testing::HasSubstr("quota exceeded"));
}

TEST_F(SearchServiceTest, FormatResults_EmptyList) {
  EXPECT_EQ(SearchService::format_results({}), "No results found for your search.");
}

TEST_F(SearchServiceTest, FormatResults_Layout) {
  std::vector<SearchResult> results = {create_search_result("First chunk", 0.8771, "a.txt"),
                                       create_search_result("Second chunk", 0.5, "b.md")};

  std::string output = SearchService::format_results(results);

  std::string expected = "Search Results (2 results):\n" + std::string(50, '=') + "\n\n" +
                         "1. Source: a.txt | Similarity: 87.7%\n" + "First chunk\n\n" +
                         std::string(30, '-') + "\n\n" +
                         "2. Source: b.md | Similarity: 50.0%\n" + "Second chunk\n\n" +
                         std::string(30, '-') + "\n\n";
  EXPECT_EQ(output, expected);
}

}  // namespace docsearch_core
