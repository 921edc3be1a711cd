#include "docsearch_core/extractors/markdown_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace docsearch_core {

bool MarkdownExtractor::can_handle(const std::filesystem::path& file_path) const {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".md" || extension == ".markdown";
}

std::string MarkdownExtractor::strip_front_matter(const std::string& content) {
  // Front matter must open on the very first line with "---"
  if (content.rfind("---\n", 0) != 0 && content.rfind("---\r\n", 0) != 0) {
    return content;
  }
  size_t line_start = content.find('\n') + 1;
  while (line_start < content.size()) {
    size_t line_end = content.find('\n', line_start);
    std::string line = content.substr(
        line_start, line_end == std::string::npos ? std::string::npos : line_end - line_start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line == "---" || line == "...") {
      return line_end == std::string::npos ? std::string() : content.substr(line_end + 1);
    }
    if (line_end == std::string::npos) {
      break;
    }
    line_start = line_end + 1;
  }
  // Unterminated block: treat the dashes as a horizontal rule
  return content;
}

std::string MarkdownExtractor::extract_text(const std::filesystem::path& file_path) const {
  std::string content = strip_front_matter(get_string_content(file_path));
  ensure_not_empty(content, file_path);

  std::string text = normalize_paragraph_breaks(content);
  std::clog << "[Extractor] Read " << text.size() << " characters of Markdown from "
            << file_path.string() << std::endl;
  return text;
}

}  // namespace docsearch_core
