#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kb_core/errors.hpp"
#include "kb_core/types/chunk.hpp"

namespace kb_core {

// Wire shape shared by the CLI and the HTTP API.
inline nlohmann::json search_result_to_json(const SearchResult &result) {
  return {{"text", result.text},
          {"url", result.url},
          {"title", result.title},
          {"page_type", to_string(result.page_type)},
          {"product_info", result.product_info},
          {"score", result.score}};
}

inline nlohmann::json search_results_to_json(const std::vector<SearchResult> &results) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &result : results) {
    out.push_back(search_result_to_json(result));
  }
  return out;
}

inline nlohmann::json error_to_json(const std::string &message, const std::string &kind) {
  return {{"error", message}, {"kind", kind}};
}

inline nlohmann::json error_to_json(const KbError &error) {
  return error_to_json(error.what(), kind_to_string(error.kind()));
}

}  // namespace kb_core
