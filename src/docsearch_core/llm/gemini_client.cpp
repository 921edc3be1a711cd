#include "docsearch_core/llm/gemini_client.hpp"

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

GeminiClient::GeminiClient(const std::string &api_key,
                           const std::string &embedding_model,
                           const std::string &base_url)
    : api_key_(api_key),
      embedding_model_(normalize_model_name(embedding_model)),
      base_url_(base_url),
      curl_handle_(nullptr) {
  if (api_key_.empty()) {
    throw ConfigurationError("Gemini API key is empty");
  }
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw ConfigurationError("Failed to initialize CURL");
  }
}

GeminiClient::~GeminiClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

std::string GeminiClient::normalize_model_name(const std::string &model) {
  if (model.rfind("models/", 0) == 0 || model.rfind("tunedModels/", 0) == 0) {
    return model;
  }
  return "models/" + model;
}

std::string GeminiClient::endpoint_url() const {
  std::string base = base_url_;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + embedding_model_ + ":batchEmbedContents";
}

nlohmann::json GeminiClient::build_request_body(const std::string &model,
                                                const std::vector<std::string> &texts) {
  nlohmann::json requests = nlohmann::json::array();
  for (const auto &text : texts) {
    nlohmann::json part = {{"text", text}};
    nlohmann::json content;
    content["parts"] = nlohmann::json::array({part});

    nlohmann::json request;
    request["model"] = model;
    request["content"] = content;
    requests.push_back(request);
  }
  return {{"requests", requests}};
}

BatchEmbeddingResult GeminiClient::parse_response(long http_status, const std::string &body) {
  nlohmann::json json_response = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);
  if (json_response.is_discarded()) {
    return BatchEmbeddingResult::failure_response("Response is not valid JSON (HTTP " +
                                                  std::to_string(http_status) + ")");
  }

  if (http_status != 200) {
    std::string message = "unknown error";
    if (json_response.contains("error") && json_response["error"].is_object()) {
      message = json_response["error"].value("message", message);
    }
    return BatchEmbeddingResult::failure_response("HTTP " + std::to_string(http_status) + ": " +
                                                  message);
  }

  if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
    return BatchEmbeddingResult::failure_response("Response does not contain embeddings field");
  }

  std::vector<std::vector<float>> embeddings;
  try {
    for (const auto &entry : json_response["embeddings"]) {
      if (!entry.contains("values") || !entry["values"].is_array()) {
        return BatchEmbeddingResult::failure_response("Embedding entry has no values array");
      }
      embeddings.push_back(entry["values"].get<std::vector<float>>());
    }
  } catch (const nlohmann::json::exception &e) {
    return BatchEmbeddingResult::failure_response(std::string("Malformed embedding values: ") +
                                                  e.what());
  }
  return BatchEmbeddingResult::success_response(std::move(embeddings));
}

size_t GeminiClient::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

BatchEmbeddingResult GeminiClient::embed_batch(const std::vector<std::string> &texts) {
  std::string request_body;
  try {
    request_body = build_request_body(embedding_model_, texts).dump();
  } catch (const nlohmann::json::exception &e) {
    // dump() rejects text that is not valid UTF-8
    return BatchEmbeddingResult::failure_response(std::string("Failed to encode request: ") +
                                                  e.what());
  }

  const std::string url = endpoint_url();
  const std::string key_header = "x-goog-api-key: " + api_key_;
  std::string response_body;

  curl_easy_reset(curl_handle_);
  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, key_header.c_str());

  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_body.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, REQUEST_TIMEOUT_SECONDS);

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    return BatchEmbeddingResult::failure_response(std::string("HTTP request failed: ") +
                                                  curl_easy_strerror(res));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  return parse_response(http_code, response_body);
}

}  // namespace docsearch_core
