#include "docsearch_cli/cli_handler.hpp"

#include <stdexcept>

namespace docsearch_cli {

namespace {

int parse_top_k(const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid value for --top-k: " + value);
    }
    return parsed;
  } catch (const std::invalid_argument &) {
    throw CliError("Invalid value for --top-k: " + value);
  } catch (const std::out_of_range &) {
    throw CliError("Value for --top-k is out of range: " + value);
  }
}

std::string require_value(int argc, char *argv[], int &i, const std::string &flag) {
  if (i + 1 >= argc) {
    throw CliError("Missing value for " + flag);
  }
  return argv[++i];
}

}  // namespace

CliHandler::CliHandler(std::shared_ptr<docsearch_core::IndexingService> indexing_service,
                       std::shared_ptr<docsearch_core::SearchService> search_service,
                       std::shared_ptr<docsearch_core::VectorStore> vector_store,
                       std::ostream &out)
    : indexing_service_(std::move(indexing_service)),
      search_service_(std::move(search_service)),
      vector_store_(std::move(vector_store)),
      out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  int i = 1;
  // Global flags come before the command
  for (; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--config" || flag == "-c") {
      options.config_path = require_value(argc, argv, i, flag);
    } else if (flag == "--verbose" || flag == "-v") {
      options.verbose = true;
    } else {
      break;
    }
  }

  if (i >= argc) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[i++];

  if (command == "index" || command == "i") {
    options.command = Command::Index;
    for (; i < argc; ++i) {
      std::string flag = argv[i];
      if (flag == "--file" || flag == "-f") {
        options.file_path = require_value(argc, argv, i, flag);
      } else if (flag == "--dir" || flag == "-d") {
        options.dir_path = require_value(argc, argv, i, flag);
      } else {
        throw CliError("Unknown option for index: " + flag);
      }
    }
    if (options.file_path.empty() == options.dir_path.empty()) {
      throw CliError("Index command requires exactly one of --file or --dir. Usage: index --file <path> | --dir <folder>");
    }
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
    for (; i < argc; ++i) {
      std::string flag = argv[i];
      if (flag == "--query" || flag == "-q") {
        options.query = require_value(argc, argv, i, flag);
      } else if (flag == "--top-k" || flag == "-k") {
        options.top_k = parse_top_k(require_value(argc, argv, i, flag));
      } else {
        throw CliError("Unknown option for search: " + flag);
      }
    }
    if (options.query.empty()) {
      throw CliError("Search command requires a query. Usage: search --query <query>");
    }
  } else if (command == "list" || command == "l") {
    options.command = Command::List;
  } else if (command == "delete" || command == "rm") {
    options.command = Command::Delete;
    for (; i < argc; ++i) {
      std::string flag = argv[i];
      if (flag == "--file" || flag == "-f") {
        options.file_path = require_value(argc, argv, i, flag);
      } else {
        throw CliError("Unknown option for delete: " + flag);
      }
    }
    if (options.file_path.empty()) {
      throw CliError("Delete command requires a source. Usage: delete --file <source>");
    }
  } else if (command == "reset") {
    options.command = Command::Reset;
    for (; i < argc; ++i) {
      std::string flag = argv[i];
      if (flag == "--yes" || flag == "-y") {
        options.confirmed = true;
      } else {
        throw CliError("Unknown option for reset: " + flag);
      }
    }
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

int CliHandler::execute_command(const CliOptions &options,
                                const std::function<bool()> &should_stop) {
  switch (options.command) {
    case Command::Index:
      return handle_index_command(options, should_stop);
    case Command::Search:
      return handle_search_command(options);
    case Command::List:
      return handle_list_command();
    case Command::Delete:
      return handle_delete_command(options);
    case Command::Reset:
      return handle_reset_command(options);
    case Command::Help:
      print_help(out_);
      return 0;
  }
  return 1;
}

int CliHandler::handle_index_command(const CliOptions &options,
                                     const std::function<bool()> &should_stop) {
  if (!options.file_path.empty()) {
    out_ << "Indexing file: " << options.file_path << std::endl;
    docsearch_core::IndexResult result = indexing_service_->process_document(options.file_path);
    if (!result.success) {
      out_ << "Failed to index " << result.source << ": " << result.error_message << std::endl;
      return 1;
    }
    out_ << "Indexed " << result.source << " (" << result.chunk_count << " chunks)" << std::endl;
    return 0;
  }

  out_ << "Indexing folder: " << options.dir_path << std::endl;
  docsearch_core::DirectoryIndexSummary summary =
      indexing_service_->index_directory(options.dir_path, should_stop);

  out_ << "Indexed " << summary.succeeded << " of " << summary.attempted << " documents"
       << std::endl;
  for (const auto &source : summary.failed_sources) {
    out_ << "  failed: " << source << std::endl;
  }
  if (summary.interrupted) {
    out_ << "Interrupted before all documents were indexed" << std::endl;
    return 1;
  }
  return summary.failed_sources.empty() ? 0 : 1;
}

int CliHandler::handle_search_command(const CliOptions &options) {
  const int top_k = options.top_k.value_or(5);
  std::string output = search_service_->search_and_format(options.query, top_k);
  out_ << output << std::endl;
  return output.rfind("Search failed:", 0) == 0 ? 1 : 0;
}

int CliHandler::handle_list_command() {
  std::vector<std::string> sources = indexing_service_->list_documents();
  if (sources.empty()) {
    out_ << "No documents indexed." << std::endl;
    return 0;
  }

  out_ << "Indexed documents (" << sources.size() << "):" << std::endl;
  for (const auto &source : sources) {
    out_ << "  " << source << " (" << vector_store_->count_records(source) << " chunks)"
         << std::endl;
  }
  return 0;
}

int CliHandler::handle_delete_command(const CliOptions &options) {
  const std::string source = docsearch_core::IndexingService::source_id_for(options.file_path);
  if (!indexing_service_->delete_document(source)) {
    out_ << "Failed to delete " << source << std::endl;
    return 1;
  }
  out_ << "Deleted " << source << std::endl;
  return 0;
}

int CliHandler::handle_reset_command(const CliOptions &options) {
  if (!options.confirmed) {
    out_ << "Refusing to delete every indexed document without --yes" << std::endl;
    return 1;
  }
  if (!indexing_service_->reset()) {
    out_ << "Failed to reset the index" << std::endl;
    return 1;
  }
  out_ << "Index cleared" << std::endl;
  return 0;
}

void CliHandler::print_help(std::ostream &out) {
  out << "docsearch - semantic search over local documents\n\n"
      << "Usage: docsearch [--config <path>] [--verbose] <command> [options]\n\n"
      << "Commands:\n"
      << "  index, i     --file <path> | --dir <folder>   Index a document or a folder\n"
      << "  search, s    --query <text> [--top-k <k>]     Search indexed documents\n"
      << "  list, l                                       List indexed documents\n"
      << "  delete, rm   --file <source>                  Remove a document from the index\n"
      << "  reset        --yes                            Remove every document\n"
      << "  help, h                                       Show this help\n\n"
      << "Global options:\n"
      << "  --config, -c <path>   JSON configuration file (default: docsearchrc.json)\n"
      << "  --verbose, -v         Print diagnostics to stderr\n\n"
      << "Environment:\n"
      << "  DOCSEARCH_EMBEDDING_PROVIDER, GEMINI_API_KEY, DOCSEARCH_API_KEY,\n"
      << "  EMBEDDING_MODEL, DOCSEARCH_DB_PATH, OLLAMA_URL\n";
}

}  // namespace docsearch_cli
