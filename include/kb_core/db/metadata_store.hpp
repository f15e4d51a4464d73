#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kb_core/types/chunk.hpp"

namespace kb_core {

/**
 * Append-only chunk records addressed by ordinal.
 *
 * The store does not know about the vector index; keeping ordinals aligned
 * with it is the caller's job (IndexBuilder appends both in lockstep).
 */
class MetadataStore {
 public:
  MetadataStore() = default;

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  MetadataStore(MetadataStore &&) noexcept = default;
  MetadataStore &operator=(MetadataStore &&) noexcept = default;

  // @returns the ordinal assigned to the chunk
  Ordinal append(Chunk chunk);

  // Throws OutOfRangeError if the ordinal was never appended.
  const Chunk &get(Ordinal ordinal) const;

  size_t size() const {
    return chunks_.size();
  }

  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }

  nlohmann::json to_json() const;
  static MetadataStore from_json(const nlohmann::json &entries);

  void save(const std::filesystem::path &path) const;
  static MetadataStore load(const std::filesystem::path &path);

  static nlohmann::json chunk_to_json(const Chunk &chunk);
  static Chunk chunk_from_json(const nlohmann::json &entry);

 private:
  std::vector<Chunk> chunks_;
};

}  // namespace kb_core
