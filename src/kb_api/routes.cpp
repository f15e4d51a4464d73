#include "kb_api/routes.hpp"

#include <iostream>

#include "kb_core/services/query_engine.hpp"
#include "kb_core/types/json.hpp"

namespace kb_api {

int status_for(kb_core::ErrorKind kind) {
  switch (kind) {
    case kb_core::ErrorKind::InvalidArgument:
      return 400;
    case kb_core::ErrorKind::MissingArtifact:
    case kb_core::ErrorKind::CorruptArtifact:
    case kb_core::ErrorKind::NotLoaded:
      return 503;
    // A query vector of the wrong width means the embedder is misconfigured.
    case kb_core::ErrorKind::ProviderFailure:
    case kb_core::ErrorKind::ProviderMismatch:
    case kb_core::ErrorKind::DimensionMismatch:
      return 502;
    default:
      return 500;
  }
}

Routes::Routes(std::shared_ptr<kb_core::QueryEngine> query_engine, int default_top_k)
    : query_engine_(std::move(query_engine)), default_top_k_(default_top_k) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/reload").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_reload(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response;
  response["status"] = "healthy";
  response["version"] = "0.1.0";

  auto artifact = query_engine_->current();
  response["index_loaded"] = artifact != nullptr;
  if (artifact) {
    response["num_vectors"] = artifact->manifest().num_vectors;
    response["dimension"] = artifact->manifest().dimension;
    response["model_name"] = artifact->manifest().model_name;
  }
  return create_json_response(response);
}

crow::response Routes::handle_search(const crow::request &req) {
  nlohmann::json body;
  try {
    body = parse_json_body(req.body);
  } catch (const nlohmann::json::parse_error &e) {
    return create_error_response(
        kb_core::InvalidArgumentError("Request body is not valid JSON: " + std::string(e.what())));
  }

  try {
    std::string query = body.value("query", "");
    int top_k = body.value("top_k", default_top_k_);
    std::cout << "Search for: " << query << " with top_k: " << top_k << std::endl;

    auto results = query_engine_->query(query, top_k);
    std::cout << "Search results: " << results.size() << std::endl;
    return create_json_response(kb_core::search_results_to_json(results));
  } catch (const nlohmann::json::type_error &e) {
    return create_error_response(
        kb_core::InvalidArgumentError("Invalid search request: " + std::string(e.what())));
  } catch (const kb_core::KbError &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_error_response(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(kb_core::error_to_json(e.what(), "internal"), 500);
  }
}

crow::response Routes::handle_reload(const crow::request &) {
  try {
    std::cout << "Reloading index" << std::endl;
    query_engine_->load();

    auto artifact = query_engine_->current();
    nlohmann::json response;
    response["message"] = "Index reloaded";
    response["num_vectors"] = artifact->manifest().num_vectors;
    return create_json_response(response);
  } catch (const kb_core::KbError &e) {
    std::cerr << "Exception in handle_reload: " << e.what() << std::endl;
    return create_error_response(e);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_reload: " << e.what() << std::endl;
    return create_json_response(kb_core::error_to_json(e.what(), "internal"), 500);
  }
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  return nlohmann::json::parse(body);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

crow::response Routes::create_error_response(const kb_core::KbError &error) {
  return create_json_response(kb_core::error_to_json(error), status_for(error.kind()));
}

}  // namespace kb_api
