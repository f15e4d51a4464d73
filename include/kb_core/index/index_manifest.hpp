#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace kb_core {

struct IndexManifest {
  size_t dimension = 0;
  size_t num_vectors = 0;
  std::string model_name;

  int chunk_size = 0;
  int chunk_overlap = 0;
  size_t num_documents = 0;
  std::string corpus_sha256;
  std::string created_at;

  nlohmann::json to_json() const;
  // Throws CorruptArtifactError when a required key is missing or mistyped.
  static IndexManifest from_json(const nlohmann::json &json);

  void save(const std::filesystem::path &path) const;
  static IndexManifest load(const std::filesystem::path &path);
};

}  // namespace kb_core
