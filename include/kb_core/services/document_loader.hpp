#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include "kb_core/types/document.hpp"

namespace kb_core {

/**
 * Reads documents produced by the crawler / catalogue export.
 *
 * Accepted shapes: a top-level array of documents, an object holding that
 * array under "documents" or "pages", or a single document object.
 */
class DocumentLoader {
 public:
  static std::vector<Document> load_file(const std::filesystem::path &path);

  static std::vector<Document> from_json(const nlohmann::json &json);

  // position is only used in error messages
  static Document document_from_json(const nlohmann::json &entry, size_t position);
};

}  // namespace kb_core
