#include "docsearch_core/services/search_service.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "docsearch_core/db/vector_functions.hpp"
#include "docsearch_core/errors.hpp"

namespace docsearch_core {

SearchService::SearchService(std::shared_ptr<VectorStore> vector_store,
                             std::shared_ptr<EmbeddingClient> embedding_client)
    : vector_store_(std::move(vector_store)), embedding_client_(std::move(embedding_client)) {}

std::vector<SearchResult> SearchService::search(
    const std::vector<std::vector<float>> &query_vectors, int top_k) {
  if (query_vectors.empty()) {
    std::clog << "[Search] No embeddings provided for search" << std::endl;
    throw ValidationError("Cannot search without embeddings");
  }
  if (top_k <= 0) {
    throw ValidationError("top_k must be greater than 0, got " + std::to_string(top_k));
  }

  std::clog << "[Search] Searching with " << query_vectors.size() << " embeddings, top_k="
            << top_k << std::endl;

  std::vector<std::vector<SearchResult>> all_results;
  all_results.reserve(query_vectors.size());
  for (size_t i = 0; i < query_vectors.size(); ++i) {
    const double query_norm = vector_norm(query_vectors[i]);
    if (query_norm == 0.0) {
      std::clog << "[Search] Warning: query vector #" << (i + 1)
                << " has zero norm, cannot compute similarity." << std::endl;
      continue;
    }
    all_results.push_back(vector_store_->search_similar(query_vectors[i], query_norm, top_k));
    std::clog << "[Search] Search for embedding #" << (i + 1) << ": found "
              << all_results.back().size() << " results" << std::endl;
  }

  std::vector<SearchResult> merged = merge_results(all_results, top_k);
  if (merged.empty()) {
    std::clog << "[Search] Warning: no similar chunks found for any of the query embeddings."
              << std::endl;
  }
  return merged;
}

std::vector<SearchResult> SearchService::merge_results(
    const std::vector<std::vector<SearchResult>> &all_results, int top_k) {
  std::vector<SearchResult> final_results;
  if (top_k <= 0) {
    return final_results;
  }
  const size_t limit = static_cast<size_t>(top_k);
  // chunk text -> index in final_results
  std::unordered_map<std::string, size_t> seen_chunks;

  for (size_t round = 0; round < limit && final_results.size() < limit; ++round) {
    for (const auto &ranked : all_results) {
      if (final_results.size() >= limit) {
        break;
      }
      if (round >= ranked.size()) {
        continue;
      }

      const SearchResult &result = ranked[round];
      auto it = seen_chunks.find(result.chunk_text);
      if (it != seen_chunks.end()) {
        if (result.similarity_score > final_results[it->second].similarity_score) {
          final_results[it->second] = result;
        }
        continue;
      }

      seen_chunks.emplace(result.chunk_text, final_results.size());
      final_results.push_back(result);
    }
  }

  std::clog << "[Search] Merged " << final_results.size() << " unique results from "
            << all_results.size() << " searches" << std::endl;
  return final_results;
}

std::vector<SearchResult> SearchService::search_query(const std::string &query, int top_k) {
  std::clog << "[Search] Creating embeddings for query: '" << query << "'" << std::endl;

  std::vector<std::vector<float>> embeddings;
  {
    std::vector<std::string> chunks = chunker_.chunk(query);
    embeddings = embedding_client_->embed(chunks);
  }
  return search(embeddings, top_k);
}

std::string SearchService::search_and_format(const std::string &query, int top_k) {
  try {
    std::vector<SearchResult> results = search_query(query, top_k);
    if (results.empty()) {
      std::clog << "[Search] Warning: search completed but no results found" << std::endl;
    } else {
      std::clog << "[Search] Search completed successfully: " << results.size()
                << " results found" << std::endl;
    }
    return format_results(results);
  } catch (const ValidationError &e) {
    std::clog << "[Search] Query validation error: " << e.what() << std::endl;
    return std::string("Search failed: Invalid query: ") + e.what();
  } catch (const DocsearchError &e) {
    std::clog << "[Search] A known error occurred during search: " << e.what() << std::endl;
    return std::string("Search failed: ") + e.what();
  }
}

std::string SearchService::format_results(const std::vector<SearchResult> &results) {
  if (results.empty()) {
    return "No results found for your search.";
  }

  std::ostringstream out;
  out << "Search Results (" << results.size() << " results):\n";
  out << std::string(50, '=') << "\n\n";

  for (size_t i = 0; i < results.size(); ++i) {
    const SearchResult &result = results[i];
    out << (i + 1) << ". Source: " << result.source << " | Similarity: " << std::fixed
        << std::setprecision(1) << result.similarity_score * 100.0 << "%\n";
    out << result.chunk_text << "\n\n";
    out << std::string(30, '-') << "\n\n";
  }
  return out.str();
}

}  // namespace docsearch_core
