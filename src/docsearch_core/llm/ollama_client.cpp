#include "docsearch_core/llm/ollama_client.hpp"

#include <ollama.hpp>

#include <stdexcept>

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

namespace {

class OllamaResponseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  if (ollama_url_.empty()) {
    throw ConfigurationError("Ollama URL is empty");
  }
  // Set the server URL for ollama-hpp
  ollama::setServerURL(ollama_url_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  ollama::response response = ollama::generate_embeddings(embedding_model_, text);

  // Get the JSON structure
  auto json_response = response.as_json();

  if (json_response.contains("embeddings")) {
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw OllamaResponseError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      // Array of arrays - one input, so take the first vector
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  }
  if (json_response.contains("embedding")) {
    return json_response["embedding"].get<std::vector<float>>();
  }
  throw OllamaResponseError("Response does not contain embedding field");
}

BatchEmbeddingResult OllamaClient::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  try {
    for (const auto &text : texts) {
      embeddings.push_back(get_embedding(text));
    }
  } catch (const ollama::exception &e) {
    return BatchEmbeddingResult::failure_response("Embedding generation failed: " +
                                                  std::string(e.what()));
  } catch (const std::exception &e) {
    // Malformed responses surface as JSON type errors or OllamaResponseError
    return BatchEmbeddingResult::failure_response("Unexpected Ollama response: " +
                                                  std::string(e.what()));
  }
  return BatchEmbeddingResult::success_response(std::move(embeddings));
}

}  // namespace docsearch_core
