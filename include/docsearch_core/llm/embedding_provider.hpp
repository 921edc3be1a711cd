#pragma once

#include <memory>
#include <string>
#include <vector>

namespace docsearch_core {

class Config;

struct BatchEmbeddingResult {
  bool success;
  std::string error_message;
  std::vector<std::vector<float>> embeddings;

  static BatchEmbeddingResult success_response(std::vector<std::vector<float>> embeddings) {
    return {true, "", std::move(embeddings)};
  }

  static BatchEmbeddingResult failure_response(const std::string &error) {
    return {false, error, {}};
  }
};

// One remote call for one batch of texts. Implementations report transport and
// protocol failures through the result instead of throwing.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual BatchEmbeddingResult embed_batch(const std::vector<std::string> &texts) = 0;

  virtual std::string name() const = 0;
};

// Throws ConfigurationError when the settings for the selected provider are missing.
std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Config &config);

}  // namespace docsearch_core
