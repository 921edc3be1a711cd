#include <csignal>
#include <iostream>
#include <memory>

#include "docsearch_cli/cli_handler.hpp"
#include "docsearch_core/config.hpp"
#include "docsearch_core/db/database_manager.hpp"
#include "docsearch_core/extractors/content_extractor_factory.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
  g_stop_requested = 1;
}

}  // namespace

int main(int argc, char *argv[]) {
  std::streambuf *clog_buffer = std::clog.rdbuf();
  int exit_code = 0;
  try {
    docsearch_cli::CliOptions options = docsearch_cli::CliHandler::parse_arguments(argc, argv);
    if (!options.verbose) {
      std::clog.rdbuf(nullptr);
    }

    if (options.command == docsearch_cli::Command::Help) {
      docsearch_cli::CliHandler::print_help(std::cout);
      std::clog.rdbuf(clog_buffer);
      return 0;
    }

    docsearch_core::Config config = docsearch_core::Config::load(options.config_path);
    if (!options.top_k) {
      options.top_k = config.top_k;
    }

    docsearch_core::DatabaseManager db_manager;
    db_manager.initialize(config.database_path, config.pool_size);

    auto vector_store = std::make_shared<docsearch_core::VectorStore>(db_manager);
    auto embedding_client = docsearch_core::EmbeddingClient::create(config);
    auto extractor_factory = std::make_shared<docsearch_core::ContentExtractorFactory>();

    auto indexing_service = std::make_shared<docsearch_core::IndexingService>(
        vector_store, embedding_client, extractor_factory);
    auto search_service =
        std::make_shared<docsearch_core::SearchService>(vector_store, embedding_client);

    docsearch_cli::CliHandler handler(indexing_service, search_service, vector_store);

    // Only folder indexing polls the flag; every other command keeps the
    // default action so an interrupt ends it immediately.
    const bool stoppable = options.command == docsearch_cli::Command::Index &&
                           !options.dir_path.empty();
    if (stoppable) {
      std::signal(SIGINT, handle_stop_signal);
      std::signal(SIGTERM, handle_stop_signal);
    }
    exit_code = handler.execute_command(options, [] { return g_stop_requested != 0; });
    if (stoppable) {
      std::signal(SIGINT, SIG_DFL);
      std::signal(SIGTERM, SIG_DFL);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  std::clog.rdbuf(clog_buffer);
  return exit_code;
}
