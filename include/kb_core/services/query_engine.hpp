#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kb_core/config.hpp"
#include "kb_core/index/index_artifact.hpp"
#include "kb_core/llm/embedding_provider.hpp"
#include "kb_core/types.hpp"

namespace kb_core {

/**
 * Answers top-k queries against the currently installed IndexArtifact.
 *
 * The artifact is held behind a shared_ptr. A query copies the pointer once
 * and runs against that snapshot, so load()/swap() can install a rebuilt
 * artifact while queries are in flight without either side blocking on the
 * other for more than the pointer copy.
 */
class QueryEngine {
 public:
  QueryEngine(const KbConfig &config, std::shared_ptr<EmbeddingProvider> embedding_provider);

  // Reads the artifact from config.index_dir and installs it. On failure the
  // previously installed artifact (if any) stays in place.
  void load();

  void swap(std::shared_ptr<const IndexArtifact> artifact);

  std::shared_ptr<const IndexArtifact> current() const;

  bool is_loaded() const {
    return current() != nullptr;
  }

  // Ranked results, best first. Ordinals whose metadata cannot be resolved
  // are skipped.
  std::vector<SearchResult> query(const std::string &text, int top_k) const;

  // Pairs each hit with its chunk record, in hit order. A hit whose ordinal
  // the store does not hold is logged and left out. A loaded IndexArtifact
  // always has matching counts, so this only drops hits for stores built
  // by hand.
  static std::vector<SearchResult> join_metadata(const MetadataStore &metadata,
                                                 const std::vector<ScoredOrdinal> &hits);

 private:
  KbConfig config_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;

  mutable std::mutex artifact_mutex_;
  std::shared_ptr<const IndexArtifact> artifact_;

  void check_provider_identity(const IndexManifest &manifest) const;
  std::vector<float> embed_query(const std::string &text) const;
};

}  // namespace kb_core
