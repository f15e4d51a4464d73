#pragma once

#include <faiss/IndexFlat.h>

#include <filesystem>
#include <memory>
#include <vector>

#include "kb_core/types/chunk.hpp"

namespace kb_core {

struct ScoredOrdinal {
  Ordinal ordinal;
  float score;
};

/**
 * Exact inner-product index over appended vectors.
 *
 * Storage is a FAISS flat IP index; rows are ordinals. Search is exhaustive,
 * O(n * d) per query. The dimension is fixed by the first add().
 */
class VectorIndex {
 public:
  explicit VectorIndex(bool validate_norms = false, float norm_tolerance = 1e-3f);
  ~VectorIndex();

  // Disable copy constructor and assignment
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  VectorIndex(VectorIndex &&) noexcept;
  VectorIndex &operator=(VectorIndex &&) noexcept;

  // Appends at the next ordinals and returns the first one assigned. All or
  // nothing: throws DimensionMismatchError (or ProviderError for a vector off
  // the unit sphere when norms are validated) without appending anything.
  Ordinal add(const std::vector<std::vector<float>> &vectors);

  // Top-k by descending score, ties by ascending ordinal. Empty index -> {}.
  std::vector<ScoredOrdinal> search(const std::vector<float> &query_vector, size_t k) const;

  std::vector<float> reconstruct(Ordinal ordinal) const;

  size_t size() const;
  size_t dimension() const {
    return dimension_;
  }

  void save(const std::filesystem::path &path) const;
  static VectorIndex load(const std::filesystem::path &path,
                          bool validate_norms = false,
                          float norm_tolerance = 1e-3f);

 private:
  std::unique_ptr<faiss::IndexFlatIP> index_;
  size_t dimension_ = 0;
  bool validate_norms_;
  float norm_tolerance_;

  bool is_unit_norm(const float *vector, size_t dimension) const;
};

}  // namespace kb_core
