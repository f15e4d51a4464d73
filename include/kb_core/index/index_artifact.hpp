#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "kb_core/config.hpp"
#include "kb_core/db/metadata_store.hpp"
#include "kb_core/index/index_manifest.hpp"
#include "kb_core/index/vector_index.hpp"

namespace kb_core {

/**
 * One complete, immutable index: vectors, their chunk records, and the
 * manifest describing them. Construction checks that the three agree, so an
 * IndexArtifact that exists is always consistent.
 */
class IndexArtifact {
 public:
  // Throws CorruptArtifactError if counts or dimensions disagree.
  IndexArtifact(VectorIndex vectors, MetadataStore metadata, IndexManifest manifest);

  IndexArtifact(const IndexArtifact &) = delete;
  IndexArtifact &operator=(const IndexArtifact &) = delete;

  const VectorIndex &vectors() const {
    return vectors_;
  }
  const MetadataStore &metadata() const {
    return metadata_;
  }
  const IndexManifest &manifest() const {
    return manifest_;
  }

  // Writes the three files into a staging directory next to config.index_dir
  // and renames it into place once all of them are on disk.
  void persist(const KbConfig &config) const;

  // Fails with MissingArtifactError / CorruptArtifactError before returning
  // anything a query could touch.
  static std::shared_ptr<const IndexArtifact> load(const KbConfig &config);

  // index_dir without a trailing separator.
  static std::filesystem::path normalized_dir(const std::string &index_dir);

  // Moves staging to target, keeping the old target as "<target>.previous"
  // until the move succeeds. On failure the old target is restored and
  // IoError is thrown.
  static void replace_directory(const std::filesystem::path &staging,
                                const std::filesystem::path &target);

 private:
  VectorIndex vectors_;
  MetadataStore metadata_;
  IndexManifest manifest_;

  void validate() const;
};

}  // namespace kb_core
