#include "docsearch_core/db/vector_store.hpp"

#include <iostream>

#include "docsearch_core/db/pooled_connection.hpp"
#include "docsearch_core/db/sqlite_error_utils.hpp"
#include "docsearch_core/db/transaction.hpp"
#include "docsearch_core/db/vector_functions.hpp"
#include "docsearch_core/errors.hpp"

namespace docsearch_core {

namespace {

bool is_blank(const std::string &text) {
  return text.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

}  // namespace

VectorStore::VectorStore(DatabaseManager &db_manager) : db_manager_(db_manager) {
  ensure_schema();
}

void VectorStore::ensure_schema() {
  try {
    PooledConnection conn(db_manager_);
    register_vector_functions(conn.native_handle());

    *conn << R"(
        CREATE TABLE IF NOT EXISTS documents (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source TEXT NOT NULL,
            chunk_text TEXT NOT NULL,
            split_strategy TEXT NOT NULL,
            created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            embedding BLOB NOT NULL,
            embedding_norm REAL NOT NULL
        )
      )";
    *conn << "CREATE INDEX IF NOT EXISTS idx_documents_source ON documents(source)";
    std::clog << "[VectorStore] Database schema verified." << std::endl;
  } catch (const sqlite::sqlite_exception &e) {
    throw DatabaseError(format_db_error("ensure_schema", e));
  }
}

void VectorStore::insert_chunks(const std::string &source,
                                const std::vector<std::string> &chunks,
                                const std::vector<std::vector<float>> &embeddings,
                                const std::string &split_strategy) {
  if (chunks.empty()) {
    throw ValidationError("Chunks list cannot be empty for indexing.");
  }
  if (embeddings.empty()) {
    throw ValidationError("Embeddings list cannot be empty for indexing.");
  }
  if (chunks.size() != embeddings.size()) {
    throw ValidationError("Chunks count (" + std::to_string(chunks.size()) +
                          ") doesn't match embeddings count (" +
                          std::to_string(embeddings.size()) + ").");
  }
  if (is_blank(source)) {
    throw ValidationError("Source identifier cannot be empty for indexing.");
  }
  for (size_t i = 0; i < embeddings.size(); ++i) {
    if (embeddings[i].empty()) {
      throw ValidationError("Embedding " + std::to_string(i) + " for '" + source + "' is empty.");
    }
  }

  std::clog << "[VectorStore] Inserting " << chunks.size() << " chunks for '" << source
            << "' in a single batch." << std::endl;

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);

    auto statement = *conn << "INSERT INTO documents (source, chunk_text, split_strategy, "
                              "embedding, embedding_norm) VALUES (?, ?, ?, ?, vector_norm(?))";
    for (size_t i = 0; i < chunks.size(); ++i) {
      std::vector<char> blob = to_blob(embeddings[i]);
      statement << source << chunks[i] << split_strategy << blob << blob;
      statement++;
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    std::clog << "[VectorStore] Failed to store data for '" << source << "': " << e.what()
              << std::endl;
    throw DatabaseError(format_db_error("insert_chunks", e));
  }

  std::clog << "[VectorStore] Stored " << chunks.size() << " chunks for '" << source << "'."
            << std::endl;
}

bool VectorStore::delete_source(const std::string &source) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM documents WHERE source = ?" << source;
    std::clog << "[VectorStore] Deleted " << sqlite3_changes(conn.native_handle())
              << " rows for " << source << std::endl;
    return true;
  } catch (const sqlite::sqlite_exception &e) {
    std::clog << "[VectorStore] Failed to delete data for '" << source
              << "': " << format_db_error("delete_source", e) << std::endl;
  } catch (const DatabaseError &e) {
    std::clog << "[VectorStore] Failed to delete data for '" << source << "': " << e.what()
              << std::endl;
  }
  return false;
}

bool VectorStore::delete_all() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);
    std::clog << "[VectorStore] Warning: clearing all data from the documents table." << std::endl;
    *conn << "DELETE FROM documents";
    // Restart row ids the way a truncate would
    *conn << "DELETE FROM sqlite_sequence WHERE name = 'documents'";
    tx.commit();
    return true;
  } catch (const sqlite::sqlite_exception &e) {
    std::clog << "[VectorStore] Failed to clear documents: " << format_db_error("delete_all", e)
              << std::endl;
  } catch (const DatabaseError &e) {
    std::clog << "[VectorStore] Failed to clear documents: " << e.what() << std::endl;
  }
  return false;
}

std::vector<std::string> VectorStore::list_sources() {
  std::vector<std::string> sources;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT DISTINCT source FROM documents ORDER BY source" >>
        [&](std::string source) { sources.push_back(std::move(source)); };
  } catch (const sqlite::sqlite_exception &e) {
    std::clog << "[VectorStore] Failed to list sources: " << format_db_error("list_sources", e)
              << std::endl;
    return {};
  } catch (const DatabaseError &e) {
    std::clog << "[VectorStore] Failed to list sources: " << e.what() << std::endl;
    return {};
  }
  return sources;
}

int VectorStore::count_records(const std::string &source) {
  try {
    int count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM documents WHERE source = ?" << source >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw DatabaseError(format_db_error("count_records", e));
  }
}

std::vector<EmbeddingRecord> VectorStore::get_records(const std::string &source) {
  std::vector<EmbeddingRecord> records;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, source, chunk_text, split_strategy, embedding, embedding_norm "
             "FROM documents WHERE source = ? ORDER BY id"
          << source >>
        [&](int id, std::string row_source, std::string chunk_text, std::string split_strategy,
            std::vector<char> embedding, double embedding_norm) {
          EmbeddingRecord record;
          record.id = id;
          record.source = std::move(row_source);
          record.chunk_text = std::move(chunk_text);
          record.split_strategy = std::move(split_strategy);
          record.embedding = from_blob(embedding);
          record.embedding_norm = embedding_norm;
          records.push_back(std::move(record));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw DatabaseError(format_db_error("get_records", e));
  }
  return records;
}

std::vector<SearchResult> VectorStore::search_similar(const std::vector<float> &query_vector,
                                                      double query_norm,
                                                      int k) {
  std::vector<SearchResult> results;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT chunk_text, source, split_strategy, "
             "dot_product(embedding, ?) / (embedding_norm * ?) AS similarity_score "
             "FROM documents WHERE embedding_norm > 0 "
             "ORDER BY similarity_score DESC, id ASC LIMIT ?"
          << to_blob(query_vector) << query_norm << k >>
        [&](std::string chunk_text, std::string source, std::string split_strategy,
            double similarity_score) {
          results.push_back(
              {std::move(chunk_text), std::move(source), std::move(split_strategy), similarity_score});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw DatabaseSearchError(format_db_error("search_similar", e));
  } catch (const DatabaseError &e) {
    throw DatabaseSearchError(std::string("search_similar failed: ") + e.what());
  }
  return results;
}

}  // namespace docsearch_core
