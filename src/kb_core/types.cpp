#include "kb_core/types.hpp"

namespace kb_core {

std::string to_string(PageType type) {
  switch (type) {
    case PageType::Product:
      return "product";
    case PageType::Info:
      return "info";
    case PageType::Policy:
      return "policy";
    default:
      return "general";
  }
}

std::optional<PageType> page_type_from_string(const std::string& str) {
  if (str == "product")
    return PageType::Product;
  if (str == "info")
    return PageType::Info;
  if (str == "policy")
    return PageType::Policy;
  if (str == "general")
    return PageType::General;
  return std::nullopt;
}

}  // namespace kb_core
