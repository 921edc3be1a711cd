#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

namespace docsearch_core {

/**
 * @class ContentExtractorFactory
 * @brief Picks the extractor for a document from its file extension.
 *
 * Plain text and Markdown are registered. Anything else is rejected with
 * DocumentProcessingError, so folder indexing filters with is_supported()
 * first.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Returns the first registered extractor that accepts the file.
   * @throw DocumentProcessingError if no extractor accepts it.
   */
  virtual const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  bool is_supported(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors_;
};

}  // namespace docsearch_core
