#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kb_core {

// Half-open window [start, end) over the normalized text, in code points.
struct ChunkSpan {
  size_t start;
  size_t end;
};

/**
 * Splits text into overlapping passages.
 *
 * Whitespace runs are collapsed to single spaces and the text is trimmed
 * before windowing. Each window is chunk_size code points wide; when it does
 * not reach the end of the text it is pulled back to the last ". " inside it,
 * provided that keeps at least 70% of the window. Consecutive windows share
 * `overlap` code points.
 */
class DocumentChunker {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 800;
  static constexpr size_t DEFAULT_OVERLAP = 100;
  static constexpr double MIN_BOUNDARY_FRACTION = 0.7;

  // Throws InvalidArgumentError unless 0 < overlap < chunk_size.
  explicit DocumentChunker(size_t chunk_size = DEFAULT_CHUNK_SIZE,
                           size_t overlap = DEFAULT_OVERLAP);

  std::vector<std::string> chunk(const std::string& text) const;

  // Windows over normalize(text); chunk() returns their trimmed contents.
  std::vector<ChunkSpan> spans(const std::string& text) const;

  static std::string normalize(const std::string& text);

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t overlap() const {
    return overlap_;
  }

 private:
  size_t chunk_size_;
  size_t overlap_;
  size_t min_boundary_;

  static std::u32string normalize_u32(const std::string& text);
  std::vector<ChunkSpan> compute_spans(const std::u32string& text) const;
};

}  // namespace kb_core
