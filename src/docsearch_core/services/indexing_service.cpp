#include "docsearch_core/services/indexing_service.hpp"

#include <algorithm>
#include <iostream>

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

IndexingService::IndexingService(
    std::shared_ptr<VectorStore> vector_store,
    std::shared_ptr<EmbeddingClient> embedding_client,
    std::shared_ptr<ContentExtractorFactory> content_extractor_factory)
    : vector_store_(std::move(vector_store)),
      embedding_client_(std::move(embedding_client)),
      content_extractor_factory_(std::move(content_extractor_factory)) {}

std::string IndexingService::source_id_for(const std::filesystem::path& file_path) {
  return file_path.lexically_normal().string();
}

IndexResult IndexingService::process_document(const std::filesystem::path& file_path) {
  const std::string source = source_id_for(file_path);
  std::clog << "[Indexing] Processing document: " << source << std::endl;

  // Old chunks go first so a re-index never mixes two generations.
  if (!vector_store_->delete_source(source)) {
    std::clog << "[Indexing] Failed to delete existing records for " << source
              << ". Aborting." << std::endl;
    return IndexResult::failure_response("Failed to delete existing records", source);
  }

  std::string text;
  try {
    const ContentExtractor& extractor = content_extractor_factory_->get_extractor_for(file_path);
    text = extractor.extract_text(file_path);
  } catch (const DocumentProcessingError& e) {
    std::clog << "[Indexing] Failed to extract text from " << source << ": " << e.what()
              << std::endl;
    return IndexResult::failure_response(e.what(), source);
  } catch (const std::filesystem::filesystem_error& e) {
    std::clog << "[Indexing] Filesystem error while reading " << source << ": " << e.what()
              << std::endl;
    return IndexResult::failure_response(e.what(), source);
  }

  return chunk_embed_store(source, std::move(text));
}

IndexResult IndexingService::index_text(const std::string& source, std::string text) {
  std::clog << "[Indexing] Processing text for source: " << source << std::endl;
  if (!vector_store_->delete_source(source)) {
    std::clog << "[Indexing] Failed to delete existing records for " << source
              << ". Aborting." << std::endl;
    return IndexResult::failure_response("Failed to delete existing records", source);
  }
  return chunk_embed_store(source, std::move(text));
}

IndexResult IndexingService::chunk_embed_store(const std::string& source, std::string text) {
  try {
    std::vector<std::string> chunks = chunker_.chunk(text);
    std::string().swap(text);

    std::vector<std::vector<float>> embeddings = embedding_client_->embed(chunks);

    vector_store_->insert_chunks(source, chunks, embeddings, Chunker::SPLIT_STRATEGY);
    const size_t chunk_count = chunks.size();

    std::vector<std::string>().swap(chunks);
    std::vector<std::vector<float>>().swap(embeddings);

    std::clog << "[Indexing] Stored " << chunk_count << " chunks for " << source << std::endl;
    return IndexResult::success_response(source, chunk_count);
  } catch (const InvalidInputError& e) {
    std::clog << "[Indexing] Nothing to index in " << source << ": " << e.what() << std::endl;
    return IndexResult::failure_response(e.what(), source);
  } catch (const EmbeddingGenerationError& e) {
    std::clog << "[Indexing] Failed to embed chunks of " << source << ": " << e.what()
              << std::endl;
    return IndexResult::failure_response(e.what(), source);
  } catch (const DocsearchError& e) {
    std::clog << "[Indexing] Failed to store chunks of " << source << ": " << e.what()
              << std::endl;
    return IndexResult::failure_response(e.what(), source);
  }
}

DirectoryIndexSummary IndexingService::index_directory(const std::filesystem::path& directory,
                                                       const std::function<bool()>& should_stop) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    throw ValidationError("Not a directory: " + directory.string());
  }

  std::vector<std::filesystem::path> files;
  std::filesystem::directory_iterator it(directory, ec);
  const std::filesystem::directory_iterator end;
  while (!ec && it != end) {
    std::error_code entry_ec;
    const bool regular = it->is_regular_file(entry_ec);
    if (entry_ec) {
      std::clog << "[Indexing] Skipping " << it->path().string() << ": " << entry_ec.message()
                << std::endl;
    } else if (regular && content_extractor_factory_->is_supported(it->path())) {
      files.push_back(it->path());
    }
    it.increment(ec);
  }
  if (ec) {
    throw ValidationError("Cannot read directory " + directory.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  std::clog << "[Indexing] Found " << files.size() << " supported files in " << directory.string()
            << std::endl;

  DirectoryIndexSummary summary;
  for (const auto& file : files) {
    if (should_stop && should_stop()) {
      std::clog << "[Indexing] Stop requested, " << (files.size() - summary.attempted)
                << " files left unprocessed" << std::endl;
      summary.interrupted = true;
      break;
    }

    ++summary.attempted;
    IndexResult result = process_document(file);
    if (result.success) {
      ++summary.succeeded;
    } else {
      summary.failed_sources.push_back(result.source);
    }
  }
  return summary;
}

bool IndexingService::delete_document(const std::string& source) {
  return vector_store_->delete_source(source);
}

bool IndexingService::reset() {
  return vector_store_->delete_all();
}

std::vector<std::string> IndexingService::list_documents() {
  return vector_store_->list_sources();
}

}  // namespace docsearch_core
