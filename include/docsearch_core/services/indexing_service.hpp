#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "docsearch_core/chunker.hpp"
#include "docsearch_core/db/vector_store.hpp"
#include "docsearch_core/extractors/content_extractor_factory.hpp"
#include "docsearch_core/llm/embedding_client.hpp"

namespace docsearch_core {

struct IndexResult {
  bool success;
  std::string error_message;
  std::string source;
  size_t chunk_count;

  static IndexResult success_response(const std::string& source, size_t chunk_count) {
    return {true, "", source, chunk_count};
  }

  static IndexResult failure_response(const std::string& error, const std::string& source = "") {
    return {false, error, source, 0};
  }
};

struct DirectoryIndexSummary {
  size_t attempted = 0;
  size_t succeeded = 0;
  std::vector<std::string> failed_sources;
  bool interrupted = false;
};

class IndexingService {
 public:
  IndexingService(std::shared_ptr<VectorStore> vector_store,
                  std::shared_ptr<EmbeddingClient> embedding_client,
                  std::shared_ptr<ContentExtractorFactory> content_extractor_factory);

  virtual ~IndexingService() = default;

  // Replaces whatever the store holds for the file. Never throws; a failed
  // step ends the run and is reported in the result.
  IndexResult process_document(const std::filesystem::path& file_path);

  // Same pipeline for text that is already in memory.
  IndexResult index_text(const std::string& source, std::string text);

  // Indexes the supported files directly inside the folder in name order.
  // should_stop is checked before each file. Throws ValidationError when
  // the path is not a directory.
  DirectoryIndexSummary index_directory(const std::filesystem::path& directory,
                                        const std::function<bool()>& should_stop = {});

  bool delete_document(const std::string& source);
  bool reset();
  std::vector<std::string> list_documents();

  static std::string source_id_for(const std::filesystem::path& file_path);

 private:
  // Steps 3 to 5 of the pipeline. Takes ownership of the text so it can be
  // released once chunked.
  IndexResult chunk_embed_store(const std::string& source, std::string text);

  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<ContentExtractorFactory> content_extractor_factory_;
  Chunker chunker_;
};

}  // namespace docsearch_core
