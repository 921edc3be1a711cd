#pragma once

#include <string>
#include <vector>

#include "docsearch_core/db/database_manager.hpp"
#include "docsearch_core/types/record.hpp"

namespace docsearch_core {

/**
 * @brief Persists chunk text with its embedding and precomputed norm.
 *
 * Every operation borrows its own pooled connection and gives it back on all
 * exit paths. Similarity scoring runs inside SQLite through the functions
 * declared by register_vector_functions().
 */
class VectorStore {
 public:
  static constexpr const char *TABLE_NAME = "documents";

  // Ensures the schema on construction.
  explicit VectorStore(DatabaseManager &db_manager);
  virtual ~VectorStore() = default;

  // Disable copy constructor and assignment
  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  // Idempotent: creates the table and index when missing and redeclares the
  // vector functions. Throws DatabaseError.
  void ensure_schema();

  /**
   * @brief Writes all chunks of one source in a single transaction.
   *
   * @throw ValidationError if the lists are empty, differ in length, hold an
   *        empty vector, or the source is blank.
   * @throw DatabaseError on any write failure; nothing from the batch is kept.
   */
  virtual void insert_chunks(const std::string &source,
                             const std::vector<std::string> &chunks,
                             const std::vector<std::vector<float>> &embeddings,
                             const std::string &split_strategy);

  // False on failure, never throws. Deleting an unknown source succeeds.
  virtual bool delete_source(const std::string &source);
  virtual bool delete_all();

  // Distinct sources in ascending order. Empty on failure.
  std::vector<std::string> list_sources();

  int count_records(const std::string &source);

  // Records of one source in insertion order.
  std::vector<EmbeddingRecord> get_records(const std::string &source);

  /**
   * @brief Top k records by cosine similarity to one query vector.
   *
   * Records with a norm of zero are skipped. Equal scores keep insertion order.
   * The caller supplies the query norm and must not pass zero.
   *
   * @throw DatabaseSearchError on any database failure, including a query
   *        vector whose length differs from a stored one.
   */
  virtual std::vector<SearchResult> search_similar(const std::vector<float> &query_vector,
                                                   double query_norm,
                                                   int k);

 private:
  DatabaseManager &db_manager_;  // non-owning
};

}  // namespace docsearch_core
