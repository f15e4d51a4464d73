#include "kb_cli/cli_handler.hpp"

#include <filesystem>
#include <iostream>

#include "kb_core/index/index_manifest.hpp"
#include "kb_core/llm/ollama_client.hpp"
#include "kb_core/services/document_loader.hpp"
#include "kb_core/services/index_builder.hpp"
#include "kb_core/services/query_engine.hpp"
#include "kb_core/types/json.hpp"

namespace kb_cli {

int exit_code_for(kb_core::ErrorKind kind) {
  switch (kind) {
    case kb_core::ErrorKind::InvalidArgument:
    case kb_core::ErrorKind::InvalidDocument:
    case kb_core::ErrorKind::Config:
      return kExitInvalidArgument;
    case kb_core::ErrorKind::MissingArtifact:
    case kb_core::ErrorKind::NotLoaded:
      return kExitMissingArtifact;
    case kb_core::ErrorKind::CorruptArtifact:
      return kExitCorruptArtifact;
    case kb_core::ErrorKind::ProviderFailure:
    case kb_core::ErrorKind::ProviderMismatch:
    case kb_core::ErrorKind::DimensionMismatch:
      return kExitProvider;
    default:
      return kExitOther;
  }
}

CliHandler::CliHandler(ProviderFactory provider_factory)
    : provider_factory_(std::move(provider_factory)) {
  if (!provider_factory_) {
    throw CliError("CliHandler requires a provider factory");
  }
}

ProviderFactory CliHandler::ollama_provider_factory() {
  return [](const kb_core::KbConfig &config) -> std::shared_ptr<kb_core::EmbeddingProvider> {
    return std::make_shared<kb_core::OllamaClient>(config.ollama_url, config.embedding_model);
  };
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "build" || command == "b") {
    options.command = Command::Build;
  } else if (command == "query" || command == "q") {
    options.command = Command::Query;
  } else if (command == "info" || command == "i") {
    options.command = Command::Info;
  } else if (command == "help" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; i += 2) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[i + 1];

    if (flag == "--config" || flag == "-c") {
      options.config_path = value;
    } else if (flag == "--documents" || flag == "-d") {
      options.documents_path = value;
    } else if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--top-k" || flag == "-k") {
      try {
        options.top_k = std::stoi(value);
      } catch (const std::exception &) {
        throw CliError("--top-k expects an integer, got '" + value + "'");
      }
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  if (options.command == Command::Build && options.documents_path.empty()) {
    throw CliError("Build command requires a documents file. Usage: build --documents <path>");
  }
  if (options.command == Command::Query &&
      options.query.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw CliError("Query required. Usage: query --query <text> [--top-k N]");
  }
  return options;
}

kb_core::KbConfig CliHandler::load_config(const CliOptions &options) const {
  if (!options.config_path.empty()) {
    return kb_core::KbConfig::from_file(options.config_path);
  }
  if (std::filesystem::exists("kbrc.json")) {
    return kb_core::KbConfig::from_file("kbrc.json");
  }
  return kb_core::KbConfig::defaults();
}

int CliHandler::execute_command(const CliOptions &options, std::ostream &out) {
  try {
    nlohmann::json result;
    switch (options.command) {
      case Command::Build:
        result = handle_build_command(options);
        break;
      case Command::Query:
        result = handle_query_command(options);
        break;
      case Command::Info:
        result = handle_info_command(options);
        break;
      case Command::Help:
        print_help(out);
        return kExitOk;
    }
    out << result.dump() << std::endl;
    return kExitOk;
  } catch (const kb_core::KbError &e) {
    out << kb_core::error_to_json(e).dump() << std::endl;
    return exit_code_for(e.kind());
  }
}

nlohmann::json CliHandler::handle_build_command(const CliOptions &options) {
  kb_core::KbConfig config = load_config(options);
  std::vector<kb_core::Document> documents =
      kb_core::DocumentLoader::load_file(options.documents_path);

  kb_core::IndexBuilder builder(config, provider_factory_(config));
  auto artifact = builder.build_and_persist(documents);

  nlohmann::json summary = artifact->manifest().to_json();
  summary["index_dir"] = config.index_dir;
  return summary;
}

nlohmann::json CliHandler::handle_query_command(const CliOptions &options) {
  kb_core::KbConfig config = load_config(options);
  const int top_k = options.top_k.value_or(config.default_top_k);

  // Load before building the provider so a missing index fails fast.
  auto artifact = kb_core::IndexArtifact::load(config);

  kb_core::QueryEngine engine(config, provider_factory_(config));
  engine.swap(std::move(artifact));
  return kb_core::search_results_to_json(engine.query(options.query, top_k));
}

nlohmann::json CliHandler::handle_info_command(const CliOptions &options) {
  kb_core::KbConfig config = load_config(options);
  nlohmann::json info = kb_core::IndexManifest::load(config.manifest_path()).to_json();
  info["index_dir"] = config.index_dir;
  return info;
}

void CliHandler::print_help(std::ostream &out) const {
  out << "Usage: kb_cli <command> [options]\n"
      << "\n"
      << "Commands:\n"
      << "  build, b    Chunk, embed and index a documents file\n"
      << "              --documents, -d <path>   JSON documents (required)\n"
      << "  query, q    Search the persisted index\n"
      << "              --query, -q <text>       query text (required)\n"
      << "              --top-k, -k <n>          number of results\n"
      << "  info, i     Print the persisted index manifest\n"
      << "  help        Show this message\n"
      << "\n"
      << "Common options:\n"
      << "  --config, -c <path>   configuration file (default: ./kbrc.json if present)\n"
      << "\n"
      << "Exit codes: 0 ok, 1 usage, 2 invalid argument, 3 missing index,\n"
      << "            4 corrupt index, 5 embedding provider, 6 other\n";
}

}  // namespace kb_cli
