#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "kb_api/routes.hpp"
#include "kb_api/server.hpp"
#include "kb_core/config.hpp"
#include "kb_core/llm/ollama_client.hpp"
#include "kb_core/services/query_engine.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "kbrc.json";
    kb_core::KbConfig config = std::filesystem::exists(config_path)
                                   ? kb_core::KbConfig::from_file(config_path)
                                   : kb_core::KbConfig::defaults();

    std::cout << "Starting knowledge base search API..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Index Dir: " << config.index_dir << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;

    auto [host, port] = kb_api::parse_address(config.api_base_url);

    // One provider for the lifetime of the process; queries reuse it.
    auto ollama_client =
        std::make_shared<kb_core::OllamaClient>(config.ollama_url, config.embedding_model);
    auto query_engine = std::make_shared<kb_core::QueryEngine>(config, ollama_client);

    try {
      query_engine->load();
    } catch (const kb_core::KbError &e) {
      std::cerr << "Warning: starting without an index (" << kb_core::kind_to_string(e.kind())
                << "): " << e.what() << std::endl;
    }

    kb_api::Server server(host, port);
    kb_api::Routes routes(query_engine, config.default_top_k);
    routes.register_routes(server);

    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
