#include "kb_core/index/index_manifest.hpp"

#include <fstream>

#include "kb_core/errors.hpp"

namespace kb_core {

nlohmann::json IndexManifest::to_json() const {
  return {{"dimension", dimension},
          {"num_vectors", num_vectors},
          {"model_name", model_name},
          {"chunk_size", chunk_size},
          {"chunk_overlap", chunk_overlap},
          {"num_documents", num_documents},
          {"corpus_sha256", corpus_sha256},
          {"created_at", created_at}};
}

IndexManifest IndexManifest::from_json(const nlohmann::json &json) {
  if (!json.is_object()) {
    throw CorruptArtifactError("Manifest must be a JSON object");
  }
  for (const char *key : {"dimension", "num_vectors", "model_name"}) {
    if (!json.contains(key)) {
      throw CorruptArtifactError(std::string("Manifest is missing '") + key + "'");
    }
  }

  IndexManifest manifest;
  try {
    manifest.dimension = json.at("dimension").get<size_t>();
    manifest.num_vectors = json.at("num_vectors").get<size_t>();
    manifest.model_name = json.at("model_name").get<std::string>();
    manifest.chunk_size = json.value("chunk_size", 0);
    manifest.chunk_overlap = json.value("chunk_overlap", 0);
    manifest.num_documents = json.value("num_documents", size_t{0});
    manifest.corpus_sha256 = json.value("corpus_sha256", std::string());
    manifest.created_at = json.value("created_at", std::string());
  } catch (const nlohmann::json::exception &e) {
    throw CorruptArtifactError("Malformed manifest: " + std::string(e.what()));
  }
  return manifest;
}

void IndexManifest::save(const std::filesystem::path &path) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw IoError("Could not open manifest file for writing: " + path.string());
  }
  out << to_json().dump(2);
  out.flush();
  if (!out) {
    throw IoError("Failed to write manifest file: " + path.string());
  }
}

IndexManifest IndexManifest::load(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw MissingArtifactError("Missing manifest file: " + path.string());
  }
  std::ifstream in(path);
  if (!in.is_open()) {
    throw IoError("Could not open manifest file: " + path.string());
  }

  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::parse_error &e) {
    throw CorruptArtifactError("Failed to parse manifest " + path.string() + ": " + e.what());
  }
  return from_json(json);
}

}  // namespace kb_core
