#pragma once

#include <memory>
#include <string>
#include <vector>

#include "kb_core/chunking/document_chunker.hpp"
#include "kb_core/config.hpp"
#include "kb_core/index/index_artifact.hpp"
#include "kb_core/llm/embedding_provider.hpp"
#include "kb_core/types.hpp"

namespace kb_core {

class IndexBuilder {
 public:
  IndexBuilder(const KbConfig &config, std::shared_ptr<EmbeddingProvider> embedding_provider);

  // Chunk, embed and index the whole corpus. Nothing is written to disk; any
  // provider or dimension failure aborts the build.
  std::shared_ptr<const IndexArtifact> build(const std::vector<Document> &documents) const;

  // build() followed by persisting the artifact into config.index_dir.
  std::shared_ptr<const IndexArtifact> build_and_persist(
      const std::vector<Document> &documents) const;

  // Chunk records for the corpus, in ordinal order.
  std::vector<Chunk> chunk_documents(const std::vector<Document> &documents) const;

  // Hex SHA-256 over the chunk texts, each followed by a NUL byte. Throws
  // IoError if the digest cannot be computed.
  static std::string compute_corpus_hash(const std::vector<Chunk> &chunks);

 private:
  KbConfig config_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  DocumentChunker chunker_;

  std::vector<std::vector<std::vector<float>>> embed_batches(
      const std::vector<std::vector<std::string>> &batches) const;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) const;

  static std::string current_timestamp();
};

}  // namespace kb_core
