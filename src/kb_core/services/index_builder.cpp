#include "kb_core/services/index_builder.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "kb_core/errors.hpp"

namespace kb_core {

IndexBuilder::IndexBuilder(const KbConfig &config,
                           std::shared_ptr<EmbeddingProvider> embedding_provider)
    : config_(config),
      embedding_provider_(std::move(embedding_provider)),
      chunker_(static_cast<size_t>(config.chunk_size), static_cast<size_t>(config.chunk_overlap)) {
  if (!embedding_provider_) {
    throw InvalidArgumentError("IndexBuilder requires an embedding provider");
  }
}

std::vector<Chunk> IndexBuilder::chunk_documents(const std::vector<Document> &documents) const {
  std::vector<Chunk> chunks;
  for (const auto &document : documents) {
    const std::string text =
        config_.prepend_title ? document.title + "\n\n" + document.content : document.content;

    std::vector<std::string> texts = chunker_.chunk(text);
    if (texts.empty()) {
      std::cerr << "Warning: document " << document.url << " produced no chunks" << std::endl;
      continue;
    }

    int chunk_index = 0;
    for (auto &chunk_text : texts) {
      Chunk chunk;
      chunk.text = std::move(chunk_text);
      chunk.chunk_index = chunk_index++;
      chunk.title = document.title;
      chunk.url = document.url;
      chunk.page_type = document.page_type;
      chunk.product_info = document.product_info;
      chunks.push_back(std::move(chunk));
    }
  }
  return chunks;
}

std::vector<std::vector<float>> IndexBuilder::embed_batch(
    const std::vector<std::string> &texts) const {
  std::vector<std::vector<float>> vectors = embedding_provider_->embed(texts);
  if (vectors.size() != texts.size()) {
    throw ProviderError("Embedding provider returned " + std::to_string(vectors.size()) +
                        " vectors for " + std::to_string(texts.size()) + " inputs");
  }
  return vectors;
}

/*
Embeds sub-batches on up to embed_workers threads. Each worker pulls the next
batch index, so results land in their batch slot and the output order is the
input order regardless of which worker finishes first.
*/
std::vector<std::vector<std::vector<float>>> IndexBuilder::embed_batches(
    const std::vector<std::vector<std::string>> &batches) const {
  std::vector<std::vector<std::vector<float>>> results(batches.size());
  const size_t workers =
      std::min(batches.size(), static_cast<size_t>(std::max(1, config_.embed_workers)));

  std::atomic<size_t> next_batch{0};
  std::atomic<bool> failed{false};
  auto work = [&]() {
    for (size_t i = next_batch++; i < batches.size() && !failed; i = next_batch++) {
      try {
        results[i] = embed_batch(batches[i]);
      } catch (...) {
        failed = true;
        throw;
      }
      std::cout << "Embedded batch " << (i + 1) << "/" << batches.size() << std::endl;
    }
  };

  if (workers <= 1) {
    work();
    return results;
  }

  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, work));
  }

  // Join every worker before rethrowing so none outlives the results vector.
  std::exception_ptr first_error;
  for (auto &future : futures) {
    try {
      future.get();
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return results;
}

std::shared_ptr<const IndexArtifact> IndexBuilder::build(
    const std::vector<Document> &documents) const {
  std::cout << "Processing " << documents.size() << " documents into chunks..." << std::endl;
  std::vector<Chunk> chunks = chunk_documents(documents);
  std::cout << "Created " << chunks.size() << " chunks from " << documents.size() << " documents"
            << std::endl;

  if (chunks.empty()) {
    throw InvalidArgumentError("Corpus produced no chunks; nothing to index");
  }

  const size_t batch_size = static_cast<size_t>(config_.embed_batch_size);
  std::vector<std::vector<std::string>> batches;
  for (size_t start = 0; start < chunks.size(); start += batch_size) {
    const size_t end = std::min(start + batch_size, chunks.size());
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      texts.push_back(chunks[i].text);
    }
    batches.push_back(std::move(texts));
  }

  std::cout << "Creating embeddings with " << embedding_provider_->identity() << "..."
            << std::endl;
  auto embedded = embed_batches(batches);

  // Append vectors and chunk records in lockstep so ordinals line up.
  VectorIndex vectors(config_.validate_norms, static_cast<float>(config_.norm_tolerance));
  MetadataStore metadata;
  size_t next_chunk = 0;
  for (auto &batch_vectors : embedded) {
    const Ordinal first = vectors.add(batch_vectors);
    for (size_t i = 0; i < batch_vectors.size(); ++i) {
      const Ordinal ordinal = metadata.append(std::move(chunks[next_chunk++]));
      if (ordinal != first + i) {
        throw std::logic_error("Metadata ordinal " + std::to_string(ordinal) +
                               " does not match vector ordinal " + std::to_string(first + i));
      }
    }
  }

  IndexManifest manifest;
  manifest.dimension = vectors.dimension();
  manifest.num_vectors = vectors.size();
  manifest.model_name = embedding_provider_->identity();
  manifest.chunk_size = config_.chunk_size;
  manifest.chunk_overlap = config_.chunk_overlap;
  manifest.num_documents = documents.size();
  manifest.corpus_sha256 = compute_corpus_hash(metadata.chunks());
  manifest.created_at = current_timestamp();

  std::cout << "Built index with " << vectors.size() << " vectors of dimension "
            << vectors.dimension() << std::endl;
  return std::make_shared<const IndexArtifact>(std::move(vectors), std::move(metadata),
                                               std::move(manifest));
}

std::shared_ptr<const IndexArtifact> IndexBuilder::build_and_persist(
    const std::vector<Document> &documents) const {
  auto artifact = build(documents);
  artifact->persist(config_);
  return artifact;
}

std::string IndexBuilder::compute_corpus_hash(const std::vector<Chunk> &chunks) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw IoError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw IoError("Failed to initialize SHA256 digest");
  }

  // NUL-separate the texts so chunk boundaries are part of the digest.
  static const char separator = '\0';
  for (const auto &chunk : chunks) {
    if (EVP_DigestUpdate(mdctx, chunk.text.data(), chunk.text.size()) != 1 ||
        EVP_DigestUpdate(mdctx, &separator, 1) != 1) {
      EVP_MD_CTX_free(mdctx);
      throw IoError("Failed to update SHA256 digest");
    }
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw IoError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string IndexBuilder::current_timestamp() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace kb_core
