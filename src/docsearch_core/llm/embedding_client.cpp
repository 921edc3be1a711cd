#include "docsearch_core/llm/embedding_client.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include "docsearch_core/config.hpp"
#include "docsearch_core/errors.hpp"

namespace docsearch_core {

EmbeddingClient::EmbeddingClient(std::shared_ptr<EmbeddingProvider> provider,
                                 EmbeddingClientOptions options,
                                 SleepFn sleep_fn)
    : provider_(std::move(provider)), options_(options), sleep_fn_(std::move(sleep_fn)) {
  if (!provider_) {
    throw ConfigurationError("EmbeddingClient requires a provider");
  }
  if (options_.batch_size == 0 || options_.max_attempts <= 0) {
    throw ConfigurationError("EmbeddingClient batch size and attempt count must be positive");
  }
  if (!sleep_fn_) {
    sleep_fn_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
  }
}

std::shared_ptr<EmbeddingClient> EmbeddingClient::create(const Config &config,
                                                         EmbeddingClientOptions options) {
  try {
    config.validate();
    std::shared_ptr<EmbeddingProvider> provider = make_embedding_provider(config);
    return std::make_shared<EmbeddingClient>(std::move(provider), options);
  } catch (const ConfigurationError &e) {
    std::clog << "[EmbeddingClient] Configuration error: " << e.what() << std::endl;
    throw EmbeddingGenerationError(std::string("Configuration error: ") + e.what());
  }
}

std::vector<std::vector<float>> EmbeddingClient::embed(const std::vector<std::string> &chunks) {
  if (chunks.empty()) {
    std::clog << "[EmbeddingClient] Warning: chunks list is empty" << std::endl;
    throw InvalidInputError("Cannot generate embeddings for empty chunks list");
  }

  const size_t batch_size = options_.batch_size;
  const size_t total_batches = (chunks.size() + batch_size - 1) / batch_size;
  std::clog << "[EmbeddingClient] Generating embeddings for " << chunks.size() << " chunks via "
            << provider_->name() << std::endl;

  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(chunks.size());

  for (size_t batch_start = 0; batch_start < chunks.size(); batch_start += batch_size) {
    const size_t batch_end = std::min(batch_start + batch_size, chunks.size());
    std::vector<std::string> batch(chunks.begin() + batch_start, chunks.begin() + batch_end);

    std::clog << "[EmbeddingClient] Processing batch " << (batch_start / batch_size + 1) << "/"
              << total_batches << " (chunks " << (batch_start + 1) << "-" << batch_end << ")"
              << std::endl;

    for (auto &vector : embed_with_retry(batch)) {
      embeddings.push_back(std::move(vector));
    }

    if (batch_end < chunks.size()) {
      sleep_fn_(options_.batch_pause);
    }
  }

  std::clog << "[EmbeddingClient] Generated " << embeddings.size() << " embeddings" << std::endl;
  return embeddings;
}

std::vector<std::vector<float>> EmbeddingClient::embed_with_retry(
    const std::vector<std::string> &batch) {
  std::chrono::milliseconds wait = options_.initial_backoff;
  std::string last_error;

  for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    BatchEmbeddingResult result = provider_->embed_batch(batch);
    if (result.success && result.embeddings.size() == batch.size()) {
      return std::move(result.embeddings);
    }

    if (result.success) {
      last_error = "provider returned " + std::to_string(result.embeddings.size()) +
                   " embeddings for " + std::to_string(batch.size()) + " texts";
    } else {
      last_error = result.error_message;
    }

    if (attempt == options_.max_attempts) {
      break;
    }
    std::clog << "[EmbeddingClient] Warning: embedding attempt " << attempt
              << " failed, retrying in " << wait.count() << "ms: " << last_error << std::endl;
    sleep_fn_(wait);
    wait *= 2;
  }

  std::clog << "[EmbeddingClient] All " << options_.max_attempts
            << " embedding attempts failed: " << last_error << std::endl;
  throw EmbeddingGenerationError("Failed after " + std::to_string(options_.max_attempts) +
                                 " attempts: " + last_error);
}

}  // namespace docsearch_core
