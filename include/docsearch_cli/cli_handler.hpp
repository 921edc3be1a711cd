#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "docsearch_core/db/vector_store.hpp"
#include "docsearch_core/services/indexing_service.hpp"
#include "docsearch_core/services/search_service.hpp"

namespace docsearch_cli {

enum class Command { Index, Search, List, Delete, Reset, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string file_path;
  std::string dir_path;
  std::string query;
  std::optional<int> top_k;  // falls back to Config::top_k
  std::string config_path;
  bool verbose = false;
  bool confirmed = false;  // reset --yes
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  CliHandler(std::shared_ptr<docsearch_core::IndexingService> indexing_service,
             std::shared_ptr<docsearch_core::SearchService> search_service,
             std::shared_ptr<docsearch_core::VectorStore> vector_store,
             std::ostream &out = std::cout);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments. Throws CliError on bad usage.
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Returns the process exit code.
  int execute_command(const CliOptions &options,
                      const std::function<bool()> &should_stop = {});

  static void print_help(std::ostream &out);

 private:
  int handle_index_command(const CliOptions &options, const std::function<bool()> &should_stop);
  int handle_search_command(const CliOptions &options);
  int handle_list_command();
  int handle_delete_command(const CliOptions &options);
  int handle_reset_command(const CliOptions &options);

  std::shared_ptr<docsearch_core::IndexingService> indexing_service_;
  std::shared_ptr<docsearch_core::SearchService> search_service_;
  std::shared_ptr<docsearch_core::VectorStore> vector_store_;
  std::ostream &out_;
};

}  // namespace docsearch_cli
