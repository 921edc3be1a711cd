#pragma once

#include <string>
#include <vector>

namespace docsearch_core {

// One stored chunk. embedding_norm is computed by the database at insert time.
struct EmbeddingRecord {
  int id = 0;
  std::string source;
  std::string chunk_text;
  std::string split_strategy;
  std::vector<float> embedding;
  double embedding_norm = 0.0;
};

struct SearchResult {
  std::string chunk_text;
  std::string source;
  std::string split_strategy;
  double similarity_score = 0.0;
};

}  // namespace docsearch_core
