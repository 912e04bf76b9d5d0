#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "ragline_api/config.hpp"
#include "ragline_api/routes.hpp"
#include "ragline_api/server.hpp"
#include "ragline_core/db/index_repository.hpp"
#include "ragline_core/llm/ollama_client.hpp"
#include "ragline_core/rag_engine.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char **argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "raglinerc.json";
    ragline_api::Config config = ragline_api::Config::from_file(config_path);

    std::cout << "Starting ragline API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;
    std::cout << "Index: " << config.index_type << " / " << config.metric << std::endl;

    auto ollama_client = std::make_shared<ragline_core::OllamaClient>(config.to_ollama_config());
    auto engine = std::make_shared<ragline_core::RagEngine>(ollama_client, ollama_client,
                                                            config.to_engine_options());

    for (const auto &path : config.preload_indexes) {
      try {
        ragline_core::IndexHandle handle = engine->load(path);
        std::cout << "Preloaded " << path << " as " << handle << std::endl;
      } catch (const ragline_core::RaglineError &e) {
        std::cerr << "Warning: skipping preload of " << path << ": " << e.what() << std::endl;
      } catch (const ragline_core::IndexRepositoryError &e) {
        std::cerr << "Warning: skipping preload of " << path << ": " << e.what() << std::endl;
      }
    }

    auto [host, port] = ragline_api::Server::parse_address(config.api_base_url);
    ragline_api::Server server(host, port);
    ragline_api::Routes routes(engine);
    routes.register_routes(server);

    // Signals are handled here, not by Crow.
    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Shutdown signal received. Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
