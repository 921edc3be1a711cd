#pragma once

#include <string>
#include <vector>

#include "docsearch_core/llm/embedding_provider.hpp"

namespace docsearch_core {

class OllamaClient : public EmbeddingProvider {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // The embeddings endpoint takes one input per request, so a batch is a loop.
  BatchEmbeddingResult embed_batch(const std::vector<std::string> &texts) override;
  std::string name() const override { return "ollama"; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  std::vector<float> get_embedding(const std::string &text);
};

}  // namespace docsearch_core
