#include "kb_core/services/document_loader.hpp"

#include <fstream>
#include <iostream>

#include "kb_core/errors.hpp"

namespace kb_core {

namespace {

const nlohmann::json *find_document_array(const nlohmann::json &json) {
  if (json.is_array()) {
    return &json;
  }
  for (const char *key : {"documents", "pages"}) {
    auto it = json.find(key);
    if (it != json.end() && it->is_array()) {
      return &*it;
    }
  }
  return nullptr;
}

std::string required_string(const nlohmann::json &entry, const char *key, size_t position) {
  auto it = entry.find(key);
  if (it == entry.end() || !it->is_string()) {
    throw InvalidDocumentError("Document " + std::to_string(position) + " has no string '" +
                               key + "'");
  }
  return it->get<std::string>();
}

}  // namespace

Document DocumentLoader::document_from_json(const nlohmann::json &entry, size_t position) {
  if (!entry.is_object()) {
    throw InvalidDocumentError("Document " + std::to_string(position) + " is not an object");
  }

  Document document;
  document.content = required_string(entry, "content", position);
  document.url = required_string(entry, "url", position);

  auto title = entry.find("title");
  if (title != entry.end() && title->is_string()) {
    document.title = title->get<std::string>();
  }

  auto page_type = entry.find("page_type");
  if (page_type != entry.end() && page_type->is_string()) {
    auto parsed = page_type_from_string(page_type->get<std::string>());
    if (!parsed) {
      std::cerr << "Warning: document " << document.url << " has unknown page_type '"
                << page_type->get<std::string>() << "', treating as general" << std::endl;
    }
    document.page_type = parsed.value_or(PageType::General);
  }

  auto product_info = entry.find("product_info");
  if (product_info != entry.end() && !product_info->is_null()) {
    if (!product_info->is_object()) {
      throw InvalidDocumentError("Document " + std::to_string(position) +
                                 " has a product_info that is not an object");
    }
    document.product_info = *product_info;
  }
  return document;
}

std::vector<Document> DocumentLoader::from_json(const nlohmann::json &json) {
  std::vector<Document> documents;

  if (const nlohmann::json *entries = find_document_array(json)) {
    documents.reserve(entries->size());
    for (size_t i = 0; i < entries->size(); ++i) {
      documents.push_back(document_from_json((*entries)[i], i));
    }
    return documents;
  }

  if (json.is_object() && json.contains("content")) {
    documents.push_back(document_from_json(json, 0));
    return documents;
  }

  throw InvalidDocumentError(
      "Unrecognized document source: expected an array, an object with 'documents' or 'pages', "
      "or a single document");
}

std::vector<Document> DocumentLoader::load_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw IoError("Could not open documents file: " + path.string());
  }

  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidDocumentError("Failed to parse documents file " + path.string() + ": " +
                               e.what());
  }

  std::vector<Document> documents = from_json(json);
  std::cout << "Loaded " << documents.size() << " documents from " << path.string() << std::endl;
  return documents;
}

}  // namespace kb_core
