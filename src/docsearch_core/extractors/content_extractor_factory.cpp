#include "docsearch_core/extractors/content_extractor_factory.hpp"

#include "docsearch_core/errors.hpp"
#include "docsearch_core/extractors/markdown_extractor.hpp"
#include "docsearch_core/extractors/plaintext_extractor.hpp"

namespace docsearch_core {

ContentExtractorFactory::ContentExtractorFactory() {
  extractors_.push_back(std::make_unique<MarkdownExtractor>());
  extractors_.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw DocumentProcessingError("Unsupported file format: " + file_path.string());
}

bool ContentExtractorFactory::is_supported(const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return true;
    }
  }
  return false;
}

}  // namespace docsearch_core
