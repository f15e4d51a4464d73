#include "kb_core/index/vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include "kb_core/errors.hpp"

namespace kb_core {

VectorIndex::VectorIndex(bool validate_norms, float norm_tolerance)
    : validate_norms_(validate_norms), norm_tolerance_(norm_tolerance) {}

VectorIndex::~VectorIndex() = default;

VectorIndex::VectorIndex(VectorIndex &&other) noexcept
    : index_(std::move(other.index_)),
      dimension_(other.dimension_),
      validate_norms_(other.validate_norms_),
      norm_tolerance_(other.norm_tolerance_) {
  other.dimension_ = 0;
}

VectorIndex &VectorIndex::operator=(VectorIndex &&other) noexcept {
  if (this != &other) {
    index_ = std::move(other.index_);
    dimension_ = other.dimension_;
    validate_norms_ = other.validate_norms_;
    norm_tolerance_ = other.norm_tolerance_;
    other.dimension_ = 0;
  }
  return *this;
}

size_t VectorIndex::size() const {
  return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

namespace {

constexpr float kLowestScore = -std::numeric_limits<float>::infinity();

bool all_finite(const std::vector<float> &vector) {
  return std::all_of(vector.begin(), vector.end(), [](float v) { return std::isfinite(v); });
}

}  // namespace

bool VectorIndex::is_unit_norm(const float *vector, size_t dimension) const {
  const float norm = std::sqrt(faiss::fvec_norm_L2sqr(vector, dimension));
  return std::fabs(norm - 1.0f) <= norm_tolerance_;
}

Ordinal VectorIndex::add(const std::vector<std::vector<float>> &vectors) {
  const Ordinal first = size();
  if (vectors.empty()) {
    return first;
  }

  const size_t expected = dimension_ != 0 ? dimension_ : vectors.front().size();
  if (expected == 0) {
    throw DimensionMismatchError(dimension_, 0);
  }

  // Validate the whole batch before touching the index.
  std::vector<float> flat;
  flat.reserve(vectors.size() * expected);
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != expected) {
      throw DimensionMismatchError(expected, vectors[i].size());
    }
    if (!all_finite(vectors[i])) {
      throw ProviderError("Vector " + std::to_string(first + i) +
                          " contains NaN or infinite components");
    }
    flat.insert(flat.end(), vectors[i].begin(), vectors[i].end());
  }

  if (validate_norms_) {
    for (size_t i = 0; i < vectors.size(); ++i) {
      if (!is_unit_norm(vectors[i].data(), expected)) {
        throw ProviderError("Vector " + std::to_string(first + i) +
                            " is not unit-normalized (tolerance " +
                            std::to_string(norm_tolerance_) + ")");
      }
    }
  }

  if (!index_) {
    index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(expected));
    dimension_ = expected;
  }
  index_->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());
  return first;
}

std::vector<ScoredOrdinal> VectorIndex::search(const std::vector<float> &query_vector,
                                               size_t k) const {
  const size_t n = size();
  if (n == 0 || k == 0) {
    return {};
  }
  if (query_vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, query_vector.size());
  }
  if (!all_finite(query_vector)) {
    throw InvalidArgumentError("Query vector contains NaN or infinite components");
  }
  if (validate_norms_ && !is_unit_norm(query_vector.data(), dimension_)) {
    throw InvalidArgumentError("Query vector is not unit-normalized");
  }

  // Scores for every row, then a partial sort so ties resolve by ordinal
  // instead of heap order.
  std::vector<float> scores(n);
  faiss::fvec_inner_products_ny(scores.data(), query_vector.data(), index_->get_xb(), dimension_,
                                n);

  std::vector<Ordinal> ordinals(n);
  std::iota(ordinals.begin(), ordinals.end(), Ordinal{0});

  const size_t actual_k = std::min(k, n);
  std::partial_sort(ordinals.begin(), ordinals.begin() + static_cast<std::ptrdiff_t>(actual_k),
                    ordinals.end(), [&scores](Ordinal a, Ordinal b) {
                      // NaN (finite inputs can still overflow) ranks last.
                      const float sa = std::isnan(scores[a]) ? kLowestScore : scores[a];
                      const float sb = std::isnan(scores[b]) ? kLowestScore : scores[b];
                      if (sa != sb)
                        return sa > sb;
                      return a < b;
                    });

  std::vector<ScoredOrdinal> results;
  results.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    results.push_back({ordinals[i], scores[ordinals[i]]});
  }
  return results;
}

std::vector<float> VectorIndex::reconstruct(Ordinal ordinal) const {
  if (ordinal >= size()) {
    throw OutOfRangeError("Vector ordinal " + std::to_string(ordinal) + " out of range (size " +
                          std::to_string(size()) + ")");
  }
  std::vector<float> vector(dimension_);
  index_->reconstruct(static_cast<faiss::idx_t>(ordinal), vector.data());
  return vector;
}

void VectorIndex::save(const std::filesystem::path &path) const {
  if (!index_) {
    throw InvalidArgumentError("Cannot save an empty vector index");
  }
  try {
    faiss::write_index(index_.get(), path.string().c_str());
  } catch (const faiss::FaissException &e) {
    throw IoError("Failed to write vector file " + path.string() + ": " + e.what());
  }
}

VectorIndex VectorIndex::load(const std::filesystem::path &path,
                              bool validate_norms,
                              float norm_tolerance) {
  if (!std::filesystem::exists(path)) {
    throw MissingArtifactError("Missing vector file: " + path.string());
  }

  std::unique_ptr<faiss::Index> raw;
  try {
    raw.reset(faiss::read_index(path.string().c_str()));
  } catch (const faiss::FaissException &e) {
    throw CorruptArtifactError("Failed to read vector file " + path.string() + ": " + e.what());
  }

  auto *flat = dynamic_cast<faiss::IndexFlatIP *>(raw.get());
  if (!flat) {
    throw CorruptArtifactError("Vector file " + path.string() +
                               " is not a flat inner-product index");
  }
  raw.release();

  VectorIndex index(validate_norms, norm_tolerance);
  index.index_.reset(flat);
  index.dimension_ = static_cast<size_t>(flat->d);
  return index;
}

}  // namespace kb_core
