#include "kb_core/chunking/document_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cmath>
#include <iterator>

#include "kb_core/errors.hpp"

namespace kb_core {

namespace {

bool is_space(char32_t c) {
  switch (c) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case 0x1C:
    case 0x1D:
    case 0x1E:
    case 0x1F:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

std::string to_utf8(std::u32string::const_iterator begin, std::u32string::const_iterator end) {
  std::string out;
  utf8::utf32to8(begin, end, std::back_inserter(out));
  return out;
}

}  // namespace

DocumentChunker::DocumentChunker(size_t chunk_size, size_t overlap)
    : chunk_size_(chunk_size), overlap_(overlap) {
  if (overlap_ == 0 || overlap_ >= chunk_size_) {
    throw InvalidArgumentError("Chunk overlap must satisfy 0 < overlap < chunk_size (got chunk_size=" +
                               std::to_string(chunk_size_) +
                               ", overlap=" + std::to_string(overlap_) + ")");
  }
  min_boundary_ = static_cast<size_t>(std::ceil(chunk_size_ * MIN_BOUNDARY_FRACTION));
}

std::u32string DocumentChunker::normalize_u32(const std::string& text) {
  // Invalid sequences become U+FFFD instead of aborting the whole document.
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::u32string decoded;
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(decoded));

  std::u32string out;
  out.reserve(decoded.size());
  bool pending_space = false;
  for (char32_t c : decoded) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(U' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::string DocumentChunker::normalize(const std::string& text) {
  std::u32string normalized = normalize_u32(text);
  return to_utf8(normalized.begin(), normalized.end());
}

std::vector<ChunkSpan> DocumentChunker::compute_spans(const std::u32string& text) const {
  std::vector<ChunkSpan> out;
  const size_t n = text.size();
  if (n == 0)
    return out;

  size_t start = 0;
  while (true) {
    size_t end = std::min(start + chunk_size_, n);

    if (end < n) {
      // Last ". " fully inside the window, like rfind on the window text.
      for (size_t q = end - 1; q > start; --q) {
        if (text[q] == U' ' && text[q - 1] == U'.') {
          const size_t period = q - 1;
          const size_t boundary_end = period + 1;
          // The boundary must not shrink the window below the floor, and must
          // leave room to advance past the overlap.
          if (period >= start + min_boundary_ && boundary_end - start > overlap_) {
            end = boundary_end;
          }
          break;
        }
      }
    }

    out.push_back({start, end});
    if (end >= n)
      break;
    start = end - overlap_;
  }
  return out;
}

std::vector<ChunkSpan> DocumentChunker::spans(const std::string& text) const {
  return compute_spans(normalize_u32(text));
}

std::vector<std::string> DocumentChunker::chunk(const std::string& text) const {
  const std::u32string normalized = normalize_u32(text);
  std::vector<std::string> chunks;

  for (const ChunkSpan& span : compute_spans(normalized)) {
    auto begin = normalized.begin() + static_cast<std::ptrdiff_t>(span.start);
    auto end = normalized.begin() + static_cast<std::ptrdiff_t>(span.end);
    while (begin != end && *begin == U' ')
      ++begin;
    while (end != begin && *(end - 1) == U' ')
      --end;
    if (begin == end)
      continue;
    chunks.push_back(to_utf8(begin, end));
  }
  return chunks;
}

}  // namespace kb_core
