#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "kb_core/config.hpp"
#include "kb_core/errors.hpp"
#include "kb_core/llm/embedding_provider.hpp"

namespace kb_cli {

enum class Command { Build, Query, Info, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string config_path;
  std::string documents_path;
  std::string query;
  std::optional<int> top_k;  // unset means the configured default
};

// Process exit codes, one per failure class.
enum ExitCode {
  kExitOk = 0,
  kExitUsage = 1,
  kExitInvalidArgument = 2,
  kExitMissingArtifact = 3,
  kExitCorruptArtifact = 4,
  kExitProvider = 5,
  kExitOther = 6
};

int exit_code_for(kb_core::ErrorKind kind);

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

using ProviderFactory =
    std::function<std::shared_ptr<kb_core::EmbeddingProvider>(const kb_core::KbConfig &)>;

class CliHandler {
 public:
  // The factory is called at most once per command, and only for commands
  // that embed text.
  explicit CliHandler(ProviderFactory provider_factory);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Throws CliError on malformed arguments
  CliOptions parse_arguments(int argc, char *argv[]);

  // Writes the command's JSON result (or {error, kind}) to out and returns
  // the process exit code.
  int execute_command(const CliOptions &options, std::ostream &out);

  static ProviderFactory ollama_provider_factory();

 private:
  ProviderFactory provider_factory_;

  kb_core::KbConfig load_config(const CliOptions &options) const;

  nlohmann::json handle_build_command(const CliOptions &options);
  nlohmann::json handle_query_command(const CliOptions &options);
  nlohmann::json handle_info_command(const CliOptions &options);
  void print_help(std::ostream &out) const;
};

}  // namespace kb_cli
