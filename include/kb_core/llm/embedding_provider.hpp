#pragma once

#include <string>
#include <vector>

namespace kb_core {

/**
 * Turns text into dense vectors.
 *
 * embed() must return exactly one L2-normalized vector per input, in input
 * order, all of the same dimension. identity() names the model (and version,
 * where the backend has one); it is recorded in the index manifest and checked
 * again at query time.
 *
 * Implementations are long-lived and shared; embed() may be called from
 * several threads at once.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;

  virtual std::string identity() const = 0;
};

}  // namespace kb_core
