#include "docsearch_core/llm/embedding_provider.hpp"

#include "docsearch_core/config.hpp"
#include "docsearch_core/errors.hpp"
#include "docsearch_core/llm/gemini_client.hpp"
#include "docsearch_core/llm/ollama_client.hpp"

namespace docsearch_core {

std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Config &config) {
  if (config.embedding_model.empty()) {
    throw ConfigurationError("embedding_model not found (set EMBEDDING_MODEL)");
  }
  if (config.embedding_provider == "gemini") {
    return std::make_unique<GeminiClient>(config.api_key, config.embedding_model,
                                          config.gemini_base_url);
  }
  if (config.embedding_provider == "ollama") {
    return std::make_unique<OllamaClient>(config.ollama_url, config.embedding_model);
  }
  throw ConfigurationError("Unknown embedding_provider: " + config.embedding_provider);
}

}  // namespace docsearch_core
