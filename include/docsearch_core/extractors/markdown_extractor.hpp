#pragma once

#include "content_extractor.hpp"

namespace docsearch_core {

class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  // The YAML front matter block, if present, is not part of the returned text.
  std::string extract_text(const fs::path& file_path) const override;

  static std::string strip_front_matter(const std::string& content);
};

}  // namespace docsearch_core
