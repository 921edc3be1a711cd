#include "docsearch_core/extractors/content_extractor.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::error_code ec;
  const bool exists = fs::exists(file_path, ec);
  if (ec) {
    throw DocumentProcessingError("Cannot access file " + file_path.string() + ": " +
                                  ec.message());
  }
  if (!exists) {
    throw DocumentProcessingError("File not found: " + file_path.string());
  }
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentProcessingError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentProcessingError("Failed to read file: " + file_path.string());
  }
  return buffer.str();
}

void ContentExtractor::ensure_not_empty(const std::string& text, const fs::path& file_path) const {
  if (text.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    throw DocumentProcessingError("File is empty: " + file_path.string());
  }
}

namespace {

bool is_inline_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::string ContentExtractor::normalize_paragraph_breaks(const std::string& text) {
  std::string result;
  result.reserve(text.size());

  const size_t size = text.size();
  size_t i = 0;
  while (i < size) {
    // Count line breaks (each followed by any non-newline whitespace) starting at i.
    size_t breaks = 0;
    size_t end = i;
    while (true) {
      size_t pos = end;
      if (pos + 1 < size && text[pos] == '\r' && text[pos + 1] == '\n') {
        ++pos;
      }
      if (pos >= size || text[pos] != '\n') {
        break;
      }
      ++pos;
      while (pos < size && is_inline_space(text[pos])) {
        ++pos;
      }
      ++breaks;
      end = pos;
    }

    if (breaks >= 2) {
      result += "\n\n";
      i = end;
    } else {
      result += text[i];
      ++i;
    }
  }
  return result;
}

}  // namespace docsearch_core
