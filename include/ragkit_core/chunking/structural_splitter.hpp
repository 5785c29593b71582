#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ragkit_core {

// Half-open byte range [start, end) into a source string.
struct TextSpan {
  size_t start = 0;
  size_t end = 0;

  size_t length() const {
    return end - start;
  }
  bool operator==(const TextSpan& other) const {
    return start == other.start && end == other.end;
  }
};

/**
 * @class StructuralSplitter
 * @brief Recursive separator-based splitter working on byte spans.
 *
 * Separators are tried from coarsest to finest (paragraph, line, sentence,
 * word, then raw code points). Pieces are re-merged greedily up to
 * chunk_size, and every chunk after the first starts with up to
 * chunk_overlap bytes of the previous chunk. Returned spans are trimmed of
 * surrounding whitespace, never empty, and never longer than chunk_size.
 * Output depends only on the input text and the two sizes.
 */
class StructuralSplitter {
 public:
  StructuralSplitter(size_t chunk_size, size_t chunk_overlap);

  std::vector<TextSpan> split(const std::string& text) const;

  // Splits only the given range of text; returned spans index text.
  std::vector<TextSpan> split(const std::string& text, TextSpan range) const;

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t chunk_overlap() const {
    return chunk_overlap_;
  }

  static const std::vector<std::string>& separators();

 private:
  void split_recursive(const std::string& text,
                       TextSpan range,
                       size_t separator_index,
                       bool valid_utf8,
                       std::vector<TextSpan>& pieces) const;
  void split_on_code_points(const std::string& text,
                            TextSpan range,
                            bool valid_utf8,
                            std::vector<TextSpan>& pieces) const;
  std::vector<TextSpan> merge_pieces(const std::string& text,
                                     const std::vector<TextSpan>& pieces,
                                     bool valid_utf8) const;
  size_t overlap_start(const std::string& text,
                       size_t lower_bound,
                       TextSpan previous,
                       bool valid_utf8) const;

  size_t chunk_size_;
  size_t chunk_overlap_;
};

// Shrinks a span so it starts and ends on non-whitespace. Returns an empty
// span at range.end when the range is all whitespace.
TextSpan trim_span(const std::string& text, TextSpan range);

}  // namespace ragkit_core
