#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "docsearch_core/config.hpp"
#include "docsearch_core/errors.hpp"
#include "docsearch_core/llm/embedding_client.hpp"

namespace docsearch_core {

using testing::_;
using testing::Return;

class EmbeddingClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_provider_ = std::make_shared<testing::NiceMock<docsearch_tests::MockEmbeddingProvider>>();
    client_ = std::make_unique<EmbeddingClient>(
        mock_provider_, EmbeddingClientOptions{},
        [this](std::chrono::milliseconds duration) { sleeps_.push_back(duration.count()); });
  }

  static std::vector<std::string> make_chunks(size_t count) {
    std::vector<std::string> chunks;
    for (size_t i = 0; i < count; ++i) {
      chunks.push_back("chunk " + std::to_string(i));
    }
    return chunks;
  }

  // Answers each batch with vectors whose first component is the chunk number
  void answer_with_chunk_numbers() {
    ON_CALL(*mock_provider_, embed_batch(_))
        .WillByDefault([](const std::vector<std::string>& texts) {
          std::vector<std::vector<float>> embeddings;
          for (const auto& text : texts) {
            float number = std::stof(text.substr(text.find(' ') + 1));
            embeddings.push_back({number, 1.0f});
          }
          return BatchEmbeddingResult::success_response(std::move(embeddings));
        });
  }

  std::shared_ptr<testing::NiceMock<docsearch_tests::MockEmbeddingProvider>> mock_provider_;
  std::unique_ptr<EmbeddingClient> client_;
  std::vector<long long> sleeps_;
};

class EmbeddingClientBatchTest : public EmbeddingClientTest,
                                 public ::testing::WithParamInterface<size_t> {};

TEST_P(EmbeddingClientBatchTest, Embed_PreservesLengthAndOrderAcrossBatches) {
  // Arrange
  const size_t count = GetParam();
  answer_with_chunk_numbers();
  const size_t expected_batches = (count + 9) / 10;
  EXPECT_CALL(*mock_provider_, embed_batch(_)).Times(static_cast<int>(expected_batches));

  // Act
  auto embeddings = client_->embed(make_chunks(count));

  // Assert
  ASSERT_EQ(embeddings.size(), count);
  for (size_t i = 0; i < count; ++i) {
    EXPECT_FLOAT_EQ(embeddings[i][0], static_cast<float>(i));
  }
  // A pause between batches, none after the last
  EXPECT_EQ(sleeps_.size(), expected_batches - 1);
  for (long long pause : sleeps_) {
    EXPECT_EQ(pause, 100);
  }
}

INSTANTIATE_TEST_SUITE_P(BatchBoundaries, EmbeddingClientBatchTest,
                         ::testing::Values(1u, 10u, 11u, 25u));

TEST_F(EmbeddingClientTest, Embed_SplitsIntoBatchesOfTen) {
  std::vector<size_t> batch_sizes;
  ON_CALL(*mock_provider_, embed_batch(_))
      .WillByDefault([&batch_sizes](const std::vector<std::string>& texts) {
        batch_sizes.push_back(texts.size());
        return docsearch_tests::MockUtilities::indexed_embeddings(texts);
      });

  client_->embed(make_chunks(25));

  EXPECT_EQ(batch_sizes, (std::vector<size_t>{10, 10, 5}));
}

TEST_F(EmbeddingClientTest, Embed_RetriesWithExponentialBackoff) {
  // Arrange
  EXPECT_CALL(*mock_provider_, embed_batch(_))
      .WillOnce(Return(BatchEmbeddingResult::failure_response("rate limited")))
      .WillOnce(Return(BatchEmbeddingResult::failure_response("rate limited")))
      .WillOnce([](const std::vector<std::string>& texts) {
        return docsearch_tests::MockUtilities::indexed_embeddings(texts);
      });

  // Act
  auto embeddings = client_->embed(make_chunks(3));

  // Assert
  EXPECT_EQ(embeddings.size(), 3u);
  EXPECT_EQ(sleeps_, (std::vector<long long>{1000, 2000}));
}

TEST_F(EmbeddingClientTest, Embed_AllAttemptsFail_ThrowsEmbeddingGenerationError) {
  EXPECT_CALL(*mock_provider_, embed_batch(_))
      .Times(3)
      .WillRepeatedly(Return(BatchEmbeddingResult::failure_response("service unavailable")));

  try {
    client_->embed(make_chunks(2));
    FAIL() << "Expected EmbeddingGenerationError";
  } catch (const EmbeddingGenerationError& e) {
    EXPECT_THAT(e.what(), testing::HasSubstr("service unavailable"));
    EXPECT_THAT(e.what(), testing::HasSubstr("3 attempts"));
  }
  // No wait after the final attempt
  EXPECT_EQ(sleeps_, (std::vector<long long>{1000, 2000}));
}

TEST_F(EmbeddingClientTest, Embed_CountMismatchIsRetried) {
  EXPECT_CALL(*mock_provider_, embed_batch(_))
      .WillOnce(Return(BatchEmbeddingResult::success_response(std::vector<std::vector<float>>{{1.0f, 0.0f}})))
      .WillOnce([](const std::vector<std::string>& texts) {
        return docsearch_tests::MockUtilities::indexed_embeddings(texts);
      });

  auto embeddings = client_->embed(make_chunks(2));

  EXPECT_EQ(embeddings.size(), 2u);
  EXPECT_EQ(sleeps_, (std::vector<long long>{1000}));
}

TEST_F(EmbeddingClientTest, Embed_FailureInLaterBatchStopsTheRun) {
  EXPECT_CALL(*mock_provider_, embed_batch(_))
      .WillOnce([](const std::vector<std::string>& texts) {
        return docsearch_tests::MockUtilities::indexed_embeddings(texts);
      })
      .WillRepeatedly(Return(BatchEmbeddingResult::failure_response("quota exceeded")));

  EXPECT_THROW(client_->embed(make_chunks(15)), EmbeddingGenerationError);
}

TEST_F(EmbeddingClientTest, Embed_EmptyList_ThrowsInvalidInput) {
  EXPECT_CALL(*mock_provider_, embed_batch(_)).Times(0);
  EXPECT_THROW(client_->embed({}), InvalidInputError);
}

TEST_F(EmbeddingClientTest, Constructor_RequiresProvider) {
  EXPECT_THROW({ EmbeddingClient client(nullptr); }, ConfigurationError);
}

TEST_F(EmbeddingClientTest, Options_DefaultsMatchRetryPolicy) {
  EmbeddingClientOptions options;
  EXPECT_EQ(options.batch_size, 10u);
  EXPECT_EQ(options.max_attempts, 3);
  EXPECT_EQ(options.initial_backoff.count(), 1000);
  EXPECT_EQ(options.batch_pause.count(), 100);
}

TEST_F(EmbeddingClientTest, Create_MissingApiKey_ThrowsEmbeddingGenerationError) {
  Config config;
  config.embedding_provider = "gemini";
  config.embedding_model = "text-embedding-004";
  config.database_path = "docs.db";

  EXPECT_THROW(EmbeddingClient::create(config), EmbeddingGenerationError);
}

TEST_F(EmbeddingClientTest, Create_MissingModel_ThrowsEmbeddingGenerationError) {
  Config config;
  config.api_key = "key";
  config.database_path = "docs.db";

  EXPECT_THROW(EmbeddingClient::create(config), EmbeddingGenerationError);
}

}  // namespace docsearch_core
