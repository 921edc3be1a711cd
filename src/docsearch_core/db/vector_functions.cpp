#include "docsearch_core/db/vector_functions.hpp"

#include <cmath>
#include <cstring>
#include <string>

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

std::vector<char> to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> from_blob(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  if (!vector.empty()) {
    std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  }
  return vector;
}

namespace {

double dot(const float *a, const float *b, size_t count) {
  double sum = 0.0;
  for (size_t i = 0; i < count; ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

// SQLite only guarantees byte alignment for blob pointers, so copy out.
bool read_vector_arg(sqlite3_context *ctx, sqlite3_value *value, std::vector<float> &out) {
  const int bytes = sqlite3_value_bytes(value);
  if (bytes % static_cast<int>(sizeof(float)) != 0) {
    sqlite3_result_error(ctx, "vector blob size is not a multiple of 4 bytes", -1);
    return false;
  }
  out.resize(static_cast<size_t>(bytes) / sizeof(float));
  if (bytes > 0) {
    std::memcpy(out.data(), sqlite3_value_blob(value), static_cast<size_t>(bytes));
  }
  return true;
}

void sql_dot_product(sqlite3_context *ctx, int argc, sqlite3_value **argv) {
  if (argc != 2 || sqlite3_value_type(argv[0]) == SQLITE_NULL ||
      sqlite3_value_type(argv[1]) == SQLITE_NULL) {
    sqlite3_result_null(ctx);
    return;
  }
  std::vector<float> a;
  std::vector<float> b;
  if (!read_vector_arg(ctx, argv[0], a) || !read_vector_arg(ctx, argv[1], b)) {
    return;
  }
  if (a.size() != b.size()) {
    const std::string message = "dot_product: vector length mismatch (" +
                                std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")";
    sqlite3_result_error(ctx, message.c_str(), -1);
    return;
  }
  sqlite3_result_double(ctx, dot(a.data(), b.data(), a.size()));
}

void sql_vector_norm(sqlite3_context *ctx, int argc, sqlite3_value **argv) {
  if (argc != 1 || sqlite3_value_type(argv[0]) == SQLITE_NULL) {
    sqlite3_result_null(ctx);
    return;
  }
  std::vector<float> a;
  if (!read_vector_arg(ctx, argv[0], a)) {
    return;
  }
  sqlite3_result_double(ctx, std::sqrt(dot(a.data(), a.data(), a.size())));
}

}  // namespace

double dot_product(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw ValidationError("dot_product: vector length mismatch (" + std::to_string(a.size()) +
                          " vs " + std::to_string(b.size()) + ")");
  }
  return dot(a.data(), b.data(), a.size());
}

double vector_norm(const std::vector<float> &a) {
  return std::sqrt(dot(a.data(), a.data(), a.size()));
}

void register_vector_functions(sqlite3 *handle) {
  if (!handle) {
    throw DatabaseError("Cannot register vector functions on a null connection");
  }
  const int flags = SQLITE_UTF8 | SQLITE_DETERMINISTIC;
  if (sqlite3_create_function_v2(handle, "dot_product", 2, flags, nullptr, sql_dot_product,
                                 nullptr, nullptr, nullptr) != SQLITE_OK) {
    throw DatabaseError("Failed to register dot_product: " + std::string(sqlite3_errmsg(handle)));
  }
  if (sqlite3_create_function_v2(handle, "vector_norm", 1, flags, nullptr, sql_vector_norm,
                                 nullptr, nullptr, nullptr) != SQLITE_OK) {
    throw DatabaseError("Failed to register vector_norm: " + std::string(sqlite3_errmsg(handle)));
  }
}

}  // namespace docsearch_core
