#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace docsearch_core {

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Opens and reads the file. Throws DocumentProcessingError when the file is
  // missing, unreadable or has no text.
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  // Collapses every run of two or more line breaks (with any whitespace in
  // between) into one blank line.
  static std::string normalize_paragraph_breaks(const std::string& text);

 protected:
  std::string get_string_content(const fs::path& file_path) const;
  void ensure_not_empty(const std::string& text, const fs::path& file_path) const;
};

// Define a type for our smart pointers
using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docsearch_core
