#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "kb_core/errors.hpp"

namespace kb_core {

class KbConfig {
 public:
  // Artifact location
  std::string index_dir;
  std::string vector_file;
  std::string metadata_file;
  std::string manifest_file;

  // Embedding provider
  std::string ollama_url;
  std::string embedding_model;

  // Chunking
  int chunk_size;
  int chunk_overlap;
  bool prepend_title;

  // Build
  int embed_batch_size;
  int embed_workers;
  bool validate_norms;
  double norm_tolerance;

  // Query
  bool strict_provider_check;
  int default_top_k;
  std::string api_base_url;

  std::filesystem::path vector_path() const {
    return std::filesystem::path(index_dir) / vector_file;
  }
  std::filesystem::path metadata_path() const {
    return std::filesystem::path(index_dir) / metadata_file;
  }
  std::filesystem::path manifest_path() const {
    return std::filesystem::path(index_dir) / manifest_file;
  }

  // Load configuration from a JSON file at the given path
  static KbConfig from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static KbConfig from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Configuration must be a JSON object");
    }

    KbConfig config;
    try {
      config.index_dir = json_config.value("index_dir", std::string("./database"));
      config.vector_file = json_config.value("vector_file", std::string("faiss.index"));
      config.metadata_file =
          json_config.value("metadata_file", std::string("chunks_metadata.json"));
      config.manifest_file = json_config.value("manifest_file", std::string("index_info.json"));

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));

      config.chunk_size = json_config.value("chunk_size", 800);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);
      config.prepend_title = json_config.value("prepend_title", false);

      config.embed_batch_size = json_config.value("embed_batch_size", 32);
      config.embed_workers = json_config.value("embed_workers", 1);
      config.validate_norms = json_config.value("validate_norms", true);
      config.norm_tolerance = json_config.value("norm_tolerance", 1e-3);

      config.strict_provider_check = json_config.value("strict_provider_check", true);
      config.default_top_k = json_config.value("default_top_k", 5);
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    } catch (const nlohmann::json::type_error& e) {
      throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

  static KbConfig defaults() {
    return from_json(nlohmann::json::object());
  }

 private:
  void validate() const {
    if (index_dir.empty()) {
      throw ConfigError("index_dir cannot be empty");
    }
    if (vector_file.empty() || metadata_file.empty() || manifest_file.empty()) {
      throw ConfigError("artifact file names cannot be empty");
    }
    if (ollama_url.empty()) {
      throw ConfigError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigError("embedding_model cannot be empty");
    }
    if (chunk_size <= 0) {
      throw ConfigError("chunk_size must be greater than 0");
    }
    if (chunk_overlap <= 0 || chunk_overlap >= chunk_size) {
      throw ConfigError("chunk_overlap must be greater than 0 and less than chunk_size");
    }
    if (embed_batch_size <= 0) {
      throw ConfigError("embed_batch_size must be greater than 0");
    }
    if (embed_workers <= 0) {
      throw ConfigError("embed_workers must be greater than 0");
    }
    if (norm_tolerance < 0.0) {
      throw ConfigError("norm_tolerance cannot be negative");
    }
    if (default_top_k <= 0) {
      throw ConfigError("default_top_k must be greater than 0");
    }
    if (api_base_url.empty()) {
      throw ConfigError("api_base_url cannot be empty");
    }
  }
};

}  // namespace kb_core
