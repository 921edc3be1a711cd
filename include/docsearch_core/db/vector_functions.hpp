#pragma once

#include <sqlite3.h>

#include <vector>

namespace docsearch_core {

// Embeddings are stored as packed native-endian float32 blobs.
std::vector<char> to_blob(const std::vector<float> &vector);
std::vector<float> from_blob(const std::vector<char> &blob);

// Throws ValidationError when the lengths differ.
double dot_product(const std::vector<float> &a, const std::vector<float> &b);
double vector_norm(const std::vector<float> &a);

/**
 * @brief Declares dot_product(a, b) and vector_norm(a) on a SQLite connection.
 *
 * Both take float32 blobs and are registered as deterministic, so they can be
 * redefined on the same connection any number of times. A NULL argument yields
 * NULL. A blob whose size is not a multiple of four bytes, or two blobs of
 * different length, fail the statement.
 *
 * @throw DatabaseError if SQLite refuses the registration.
 */
void register_vector_functions(sqlite3 *handle);

}  // namespace docsearch_core
