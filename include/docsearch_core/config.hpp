#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

class Config {
 public:
  static constexpr const char *DEFAULT_CONFIG_FILE = "docsearchrc.json";

  std::string embedding_provider = "gemini";
  std::string api_key;
  std::string embedding_model;
  std::string database_path;
  std::string ollama_url = "http://localhost:11434";
  std::string gemini_base_url = "https://generativelanguage.googleapis.com/v1beta";
  int pool_size = 2;
  int top_k = 5;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw ConfigurationError(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    Config config;
    if (!json_config.is_object()) {
      throw ConfigurationError("Configuration must be a JSON object");
    }

    try {
      config.embedding_provider = json_config.value("embedding_provider", config.embedding_provider);
      config.api_key = json_config.value("api_key", std::string());
      config.embedding_model = json_config.value("embedding_model", std::string());
      config.database_path = json_config.value("database_path", std::string());
      config.ollama_url = json_config.value("ollama_url", config.ollama_url);
      config.gemini_base_url = json_config.value("gemini_base_url", config.gemini_base_url);
      config.pool_size = json_config.value("pool_size", config.pool_size);
      config.top_k = json_config.value("top_k", config.top_k);
    } catch (const nlohmann::json::exception &e) {
      throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
  }

  // Environment variables take precedence over values read from a file.
  void apply_environment() {
    override_from_env("DOCSEARCH_EMBEDDING_PROVIDER", embedding_provider);
    override_from_env("GEMINI_API_KEY", api_key);
    override_from_env("DOCSEARCH_API_KEY", api_key);
    override_from_env("EMBEDDING_MODEL", embedding_model);
    override_from_env("DOCSEARCH_DB_PATH", database_path);
    override_from_env("OLLAMA_URL", ollama_url);
  }

  // Reads the file when one is given (or the default file exists), overlays the
  // environment and validates. An explicitly named file must exist.
  static Config load(const std::string &filename = "") {
    Config config;
    if (!filename.empty()) {
      config = from_file(filename);
    } else if (std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
      config = from_file(DEFAULT_CONFIG_FILE);
    }
    config.apply_environment();
    config.validate();
    return config;
  }

  void validate() const {
    if (embedding_provider != "gemini" && embedding_provider != "ollama") {
      throw ConfigurationError("Unknown embedding_provider: " + embedding_provider);
    }
    if (embedding_provider == "gemini" && api_key.empty()) {
      throw ConfigurationError("api_key not found (set DOCSEARCH_API_KEY or GEMINI_API_KEY)");
    }
    if (embedding_provider == "ollama" && ollama_url.empty()) {
      throw ConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigurationError("embedding_model not found (set EMBEDDING_MODEL)");
    }
    if (database_path.empty()) {
      throw ConfigurationError("database_path not found (set DOCSEARCH_DB_PATH)");
    }
    if (pool_size <= 0) {
      throw ConfigurationError("pool_size must be greater than 0");
    }
    if (top_k <= 0) {
      throw ConfigurationError("top_k must be greater than 0");
    }
  }

 private:
  static void override_from_env(const char *name, std::string &target) {
    const char *value = std::getenv(name);
    if (value && *value) {
      target = value;
    }
  }
};

}  // namespace docsearch_core
