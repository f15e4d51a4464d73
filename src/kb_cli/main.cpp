#include <iostream>

#include "kb_cli/cli_handler.hpp"
#include "kb_core/types/json.hpp"

int main(int argc, char *argv[]) {
  // Results go to stdout as one JSON document; everything the core logs goes
  // to stderr so stdout stays parseable.
  std::ostream json_out(std::cout.rdbuf());
  std::streambuf *stdout_buf = std::cout.rdbuf(std::cerr.rdbuf());

  int exit_code = kb_cli::kExitOk;
  try {
    kb_cli::CliHandler handler(kb_cli::CliHandler::ollama_provider_factory());
    kb_cli::CliOptions options = handler.parse_arguments(argc, argv);
    exit_code = handler.execute_command(options, json_out);
  } catch (const kb_cli::CliError &e) {
    json_out << kb_core::error_to_json(e.what(), "usage").dump() << std::endl;
    exit_code = kb_cli::kExitUsage;
  } catch (const std::exception &e) {
    json_out << kb_core::error_to_json(e.what(), "internal").dump() << std::endl;
    exit_code = kb_cli::kExitOther;
  }

  std::cout.rdbuf(stdout_buf);
  return exit_code;
}
