#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docsearch_core/chunker.hpp"
#include "docsearch_core/db/vector_store.hpp"
#include "docsearch_core/llm/embedding_client.hpp"
#include "docsearch_core/types/record.hpp"

namespace docsearch_core {

class SearchService {
 public:
  SearchService(std::shared_ptr<VectorStore> vector_store,
                std::shared_ptr<EmbeddingClient> embedding_client);

  /**
   * @brief Runs one store query per vector and merges the ranked lists.
   *
   * A vector with zero norm contributes nothing. The merge is round-robin, so
   * the result is not guaranteed to be the global top-k by score.
   *
   * @throw ValidationError for an empty vector list or top_k <= 0.
   * @throw DatabaseSearchError when the store query fails.
   */
  std::vector<SearchResult> search(const std::vector<std::vector<float>> &query_vectors,
                                   int top_k);

  // Chunk, embed and search. Propagates InvalidInputError,
  // EmbeddingGenerationError and DatabaseSearchError.
  std::vector<SearchResult> search_query(const std::string &query, int top_k);

  // search_query() rendered with format_results(). Failures come back as
  // "Search failed: <cause>".
  std::string search_and_format(const std::string &query, int top_k);

  // Round-robin over the per-query lists, one item per list per round. A chunk
  // text already taken is not repeated; the kept entry gets the higher score.
  static std::vector<SearchResult> merge_results(
      const std::vector<std::vector<SearchResult>> &all_results, int top_k);

  static std::string format_results(const std::vector<SearchResult> &results);

 private:
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  Chunker chunker_;
};

}  // namespace docsearch_core
