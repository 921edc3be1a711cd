#pragma once

#include <curl/curl.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docsearch_core/llm/embedding_provider.hpp"

namespace docsearch_core {

// Google Generative Language API, batchEmbedContents endpoint.
class GeminiClient : public EmbeddingProvider {
 public:
  GeminiClient(const std::string &api_key,
               const std::string &embedding_model,
               const std::string &base_url);
  ~GeminiClient() override;

  // Disable copy constructor and assignment
  GeminiClient(const GeminiClient &) = delete;
  GeminiClient &operator=(const GeminiClient &) = delete;

  BatchEmbeddingResult embed_batch(const std::vector<std::string> &texts) override;
  std::string name() const override { return "gemini"; }

  const std::string &embedding_model() const { return embedding_model_; }
  std::string endpoint_url() const;

  // "text-embedding-004" -> "models/text-embedding-004"; tuned models are left alone.
  static std::string normalize_model_name(const std::string &model);
  static nlohmann::json build_request_body(const std::string &model,
                                           const std::vector<std::string> &texts);
  static BatchEmbeddingResult parse_response(long http_status, const std::string &body);

 private:
  std::string api_key_;
  std::string embedding_model_;
  std::string base_url_;
  CURL *curl_handle_;

  static constexpr long REQUEST_TIMEOUT_SECONDS = 60;

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace docsearch_core
