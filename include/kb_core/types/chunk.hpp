#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "kb_core/types/document.hpp"

namespace kb_core {

// Position of a chunk/vector pair; shared by VectorIndex and MetadataStore.
using Ordinal = std::size_t;

struct Chunk {
  std::string text;
  int chunk_index = 0;
  std::string title;
  std::string url;
  PageType page_type = PageType::General;
  nlohmann::json product_info = nlohmann::json::object();
};

struct SearchResult {
  std::string text;
  std::string url;
  std::string title;
  PageType page_type = PageType::General;
  nlohmann::json product_info = nlohmann::json::object();
  float score = 0.0f;
};

}  // namespace kb_core
