#include "kb_core/index/index_artifact.hpp"

#include <iostream>

#include "kb_core/errors.hpp"

namespace kb_core {

IndexArtifact::IndexArtifact(VectorIndex vectors, MetadataStore metadata, IndexManifest manifest)
    : vectors_(std::move(vectors)), metadata_(std::move(metadata)), manifest_(std::move(manifest)) {
  validate();
}

void IndexArtifact::validate() const {
  if (manifest_.num_vectors != vectors_.size() || manifest_.num_vectors != metadata_.size()) {
    throw CorruptArtifactError("Artifact counts disagree: manifest num_vectors=" +
                               std::to_string(manifest_.num_vectors) +
                               ", vector rows=" + std::to_string(vectors_.size()) +
                               ", metadata entries=" + std::to_string(metadata_.size()));
  }
  if (vectors_.size() > 0 && manifest_.dimension != vectors_.dimension()) {
    throw CorruptArtifactError("Artifact dimensions disagree: manifest dimension=" +
                               std::to_string(manifest_.dimension) +
                               ", vector file dimension=" + std::to_string(vectors_.dimension()));
  }
}

std::filesystem::path IndexArtifact::normalized_dir(const std::string &index_dir) {
  // "./database/" and "./database" must name the same directory, otherwise the
  // sibling paths below land inside it.
  std::filesystem::path dir = std::filesystem::path(index_dir).lexically_normal();
  if (!dir.has_filename()) {
    dir = dir.parent_path();
  }
  return dir;
}

void IndexArtifact::replace_directory(const std::filesystem::path &staging,
                                      const std::filesystem::path &target) {
  namespace fs = std::filesystem;
  fs::path previous = target;
  previous += ".previous";

  try {
    const bool had_target = fs::exists(target);
    if (had_target) {
      fs::remove_all(previous);
      fs::rename(target, previous);
    }

    try {
      fs::rename(staging, target);
    } catch (const fs::filesystem_error &) {
      // Put the live index back before reporting.
      if (had_target) {
        fs::rename(previous, target);
      }
      throw;
    }
    fs::remove_all(previous);
  } catch (const fs::filesystem_error &e) {
    throw IoError("Failed to replace index directory " + target.string() + ": " + e.what());
  }
}

void IndexArtifact::persist(const KbConfig &config) const {
  namespace fs = std::filesystem;
  const fs::path target = normalized_dir(config.index_dir);
  fs::path staging = target;
  staging += ".staging";

  try {
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path());
    }
    fs::remove_all(staging);
    fs::create_directories(staging);
  } catch (const fs::filesystem_error &e) {
    throw IoError("Failed to prepare staging directory " + staging.string() + ": " + e.what());
  }

  vectors_.save(staging / config.vector_file);
  metadata_.save(staging / config.metadata_file);
  manifest_.save(staging / config.manifest_file);

  replace_directory(staging, target);

  std::cout << "Saved index and metadata to " << target.string() << " (" << vectors_.size()
            << " vectors)" << std::endl;
}

std::shared_ptr<const IndexArtifact> IndexArtifact::load(const KbConfig &config) {
  // Report every missing piece at once instead of failing on the first.
  std::string missing;
  for (const auto &path : {config.vector_path(), config.metadata_path(), config.manifest_path()}) {
    if (!std::filesystem::exists(path)) {
      missing += (missing.empty() ? "" : ", ") + path.string();
    }
  }
  if (!missing.empty()) {
    throw MissingArtifactError("Missing index files: " + missing);
  }

  IndexManifest manifest = IndexManifest::load(config.manifest_path());
  MetadataStore metadata = MetadataStore::load(config.metadata_path());
  VectorIndex vectors = VectorIndex::load(config.vector_path(), config.validate_norms,
                                          static_cast<float>(config.norm_tolerance));

  auto artifact = std::make_shared<const IndexArtifact>(std::move(vectors), std::move(metadata),
                                                        std::move(manifest));
  std::cout << "Loaded index from " << config.index_dir << " ("
            << artifact->manifest().num_vectors << " vectors, dimension "
            << artifact->manifest().dimension << ", model " << artifact->manifest().model_name
            << ")" << std::endl;
  return artifact;
}

}  // namespace kb_core
