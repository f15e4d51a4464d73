#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "kb_core/errors.hpp"
#include "server.hpp"

namespace kb_core {
class QueryEngine;
}  // namespace kb_core

namespace kb_api {

// HTTP status used when a request fails with the given error kind.
int status_for(kb_core::ErrorKind kind);

class Routes {
 public:
  Routes(std::shared_ptr<kb_core::QueryEngine> query_engine, int default_top_k);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_reload(const crow::request &req);

 private:
  std::shared_ptr<kb_core::QueryEngine> query_engine_;
  int default_top_k_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_error_response(const kb_core::KbError &error);
};

}  // namespace kb_api
