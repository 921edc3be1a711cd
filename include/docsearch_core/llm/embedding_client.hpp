#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "docsearch_core/llm/embedding_provider.hpp"

namespace docsearch_core {

class Config;

struct EmbeddingClientOptions {
  size_t batch_size = 10;
  int max_attempts = 3;
  // Doubled after every failed attempt: 1s, then 2s.
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds batch_pause{100};
};

class EmbeddingClient {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  explicit EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider,
                           EmbeddingClientOptions options = {},
                           SleepFn sleep_fn = {});

  EmbeddingClient(const EmbeddingClient &) = delete;
  EmbeddingClient &operator=(const EmbeddingClient &) = delete;

  // Builds the provider named in the configuration. Configuration problems are
  // reported as EmbeddingGenerationError.
  static std::shared_ptr<EmbeddingClient> create(const Config &config,
                                                 EmbeddingClientOptions options = {});

  // One vector per chunk, in input order. Throws InvalidInputError for an empty
  // list and EmbeddingGenerationError once a batch has used up its attempts.
  std::vector<std::vector<float>> embed(const std::vector<std::string> &chunks);

  const EmbeddingClientOptions &options() const { return options_; }

 private:
  std::vector<std::vector<float>> embed_with_retry(const std::vector<std::string> &batch);

  std::shared_ptr<EmbeddingProvider> provider_;
  EmbeddingClientOptions options_;
  SleepFn sleep_fn_;
};

}  // namespace docsearch_core
