#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kb_core {

enum class PageType { Product, Info, Policy, General };

std::string to_string(PageType type);
std::optional<PageType> page_type_from_string(const std::string& str);

struct Document {
  std::string title;
  std::string content;
  std::string url;
  PageType page_type = PageType::General;
  // Opaque to the core; carried through to chunks and search results untouched.
  nlohmann::json product_info = nlohmann::json::object();
};

}  // namespace kb_core
