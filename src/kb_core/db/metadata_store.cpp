#include "kb_core/db/metadata_store.hpp"

#include <fstream>
#include <iostream>

#include "kb_core/errors.hpp"

namespace kb_core {

Ordinal MetadataStore::append(Chunk chunk) {
  chunks_.push_back(std::move(chunk));
  return chunks_.size() - 1;
}

const Chunk &MetadataStore::get(Ordinal ordinal) const {
  if (ordinal >= chunks_.size()) {
    throw OutOfRangeError("Metadata ordinal " + std::to_string(ordinal) +
                          " out of range (size " + std::to_string(chunks_.size()) + ")");
  }
  return chunks_[ordinal];
}

nlohmann::json MetadataStore::chunk_to_json(const Chunk &chunk) {
  return {{"text", chunk.text},
          {"url", chunk.url},
          {"title", chunk.title},
          {"page_type", to_string(chunk.page_type)},
          {"chunk_index", chunk.chunk_index},
          {"product_info", chunk.product_info}};
}

Chunk MetadataStore::chunk_from_json(const nlohmann::json &entry) {
  if (!entry.is_object()) {
    throw CorruptArtifactError("Metadata entry is not an object");
  }
  if (!entry.contains("text") || !entry["text"].is_string()) {
    throw CorruptArtifactError("Metadata entry is missing its text");
  }

  Chunk chunk;
  try {
    chunk.text = entry.at("text").get<std::string>();
    chunk.url = entry.value("url", std::string());
    chunk.title = entry.value("title", std::string());
    chunk.chunk_index = entry.value("chunk_index", 0);
    chunk.product_info = entry.value("product_info", nlohmann::json::object());

    std::string page_type = entry.value("page_type", std::string("general"));
    auto parsed = page_type_from_string(page_type);
    if (!parsed) {
      std::cerr << "Warning: unknown page_type '" << page_type
                << "' in metadata, treating as general" << std::endl;
    }
    chunk.page_type = parsed.value_or(PageType::General);
  } catch (const nlohmann::json::type_error &e) {
    throw CorruptArtifactError("Malformed metadata entry: " + std::string(e.what()));
  }
  return chunk;
}

nlohmann::json MetadataStore::to_json() const {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto &chunk : chunks_) {
    entries.push_back(chunk_to_json(chunk));
  }
  return entries;
}

MetadataStore MetadataStore::from_json(const nlohmann::json &entries) {
  if (!entries.is_array()) {
    throw CorruptArtifactError("Metadata must be a JSON array");
  }
  MetadataStore store;
  store.chunks_.reserve(entries.size());
  for (const auto &entry : entries) {
    store.chunks_.push_back(chunk_from_json(entry));
  }
  return store;
}

void MetadataStore::save(const std::filesystem::path &path) const {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw IoError("Could not open metadata file for writing: " + path.string());
  }
  out << to_json().dump(2);
  out.flush();
  if (!out) {
    throw IoError("Failed to write metadata file: " + path.string());
  }
}

MetadataStore MetadataStore::load(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw MissingArtifactError("Missing metadata file: " + path.string());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw IoError("Could not open metadata file: " + path.string());
  }

  nlohmann::json entries;
  try {
    in >> entries;
  } catch (const nlohmann::json::parse_error &e) {
    throw CorruptArtifactError("Failed to parse metadata file " + path.string() + ": " +
                               e.what());
  }
  return from_json(entries);
}

}  // namespace kb_core
