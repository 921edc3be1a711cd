#pragma once

#include <exception>
#include <string>

namespace docsearch_core {

class DocsearchError : public std::exception {
 public:
  explicit DocsearchError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Missing or invalid settings. Indexing and search cannot proceed.
class ConfigurationError : public DocsearchError {
 public:
  using DocsearchError::DocsearchError;
};

// The caller supplied empty or mismatched input.
class ValidationError : public DocsearchError {
 public:
  using DocsearchError::DocsearchError;
};

// Empty text handed to the chunker or an empty chunk list handed to the embedder.
class InvalidInputError : public ValidationError {
 public:
  using ValidationError::ValidationError;
};

// Remote embedding calls exhausted their retry budget.
class EmbeddingGenerationError : public DocsearchError {
 public:
  using DocsearchError::DocsearchError;
};

// Connection or write failure. Writes are rolled back before this is thrown.
class DatabaseError : public DocsearchError {
 public:
  using DocsearchError::DocsearchError;
};

class DatabaseSearchError : public DocsearchError {
 public:
  using DocsearchError::DocsearchError;
};

class DocumentProcessingError : public DocsearchError {
 public:
  using DocsearchError::DocsearchError;
};

}  // namespace docsearch_core
