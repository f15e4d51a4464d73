#include "kb_core/services/query_engine.hpp"

#include <iostream>

#include "kb_core/errors.hpp"

namespace kb_core {

QueryEngine::QueryEngine(const KbConfig &config,
                         std::shared_ptr<EmbeddingProvider> embedding_provider)
    : config_(config), embedding_provider_(std::move(embedding_provider)) {
  if (!embedding_provider_) {
    throw InvalidArgumentError("QueryEngine requires an embedding provider");
  }
}

void QueryEngine::load() {
  swap(IndexArtifact::load(config_));
}

void QueryEngine::swap(std::shared_ptr<const IndexArtifact> artifact) {
  if (!artifact) {
    throw InvalidArgumentError("Cannot install a null index artifact");
  }
  if (artifact->manifest().model_name != embedding_provider_->identity()) {
    std::cerr << "Warning: index was built with '" << artifact->manifest().model_name
              << "' but queries will use '" << embedding_provider_->identity() << "'"
              << std::endl;
  }

  std::lock_guard<std::mutex> lock(artifact_mutex_);
  artifact_ = std::move(artifact);
}

std::shared_ptr<const IndexArtifact> QueryEngine::current() const {
  std::lock_guard<std::mutex> lock(artifact_mutex_);
  return artifact_;
}

void QueryEngine::check_provider_identity(const IndexManifest &manifest) const {
  const std::string query_model = embedding_provider_->identity();
  if (manifest.model_name == query_model) {
    return;
  }
  if (config_.strict_provider_check) {
    throw ProviderMismatchError(manifest.model_name, query_model);
  }
  std::cerr << "Warning: scores are unreliable, index model '" << manifest.model_name
            << "' differs from query model '" << query_model << "'" << std::endl;
}

std::vector<float> QueryEngine::embed_query(const std::string &text) const {
  std::vector<std::vector<float>> vectors = embedding_provider_->embed({text});
  if (vectors.size() != 1) {
    throw ProviderError("Embedding provider returned " + std::to_string(vectors.size()) +
                        " vectors for a single query");
  }
  return std::move(vectors.front());
}

std::vector<SearchResult> QueryEngine::query(const std::string &text, int top_k) const {
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw InvalidArgumentError("Query required");
  }
  if (top_k <= 0) {
    throw InvalidArgumentError("top_k must be greater than 0, got " + std::to_string(top_k));
  }

  std::shared_ptr<const IndexArtifact> artifact = current();
  if (!artifact) {
    throw NotLoadedError();
  }
  check_provider_identity(artifact->manifest());

  std::vector<float> query_vector = embed_query(text);
  std::vector<ScoredOrdinal> hits =
      artifact->vectors().search(query_vector, static_cast<size_t>(top_k));

  return join_metadata(artifact->metadata(), hits);
}

std::vector<SearchResult> QueryEngine::join_metadata(const MetadataStore &metadata,
                                                     const std::vector<ScoredOrdinal> &hits) {
  std::vector<SearchResult> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    try {
      const Chunk &chunk = metadata.get(hit.ordinal);
      SearchResult result;
      result.text = chunk.text;
      result.url = chunk.url;
      result.title = chunk.title;
      result.page_type = chunk.page_type;
      result.product_info = chunk.product_info;
      result.score = hit.score;
      results.push_back(std::move(result));
    } catch (const OutOfRangeError &e) {
      std::cerr << "Warning: skipping search hit: " << e.what() << std::endl;
    }
  }
  return results;
}

}  // namespace kb_core
