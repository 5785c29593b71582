#include "ragkit_core/chunking/structural_splitter.hpp"

#include <utf8.h>

#include <algorithm>
#include <stdexcept>

namespace ragkit_core {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// First code point boundary at or after pos. Walks from a known boundary;
// limit must itself be a boundary.
size_t next_boundary(const std::string& text, size_t from_boundary, size_t pos, size_t limit,
                     bool valid_utf8) {
  if (!valid_utf8) {
    return std::min(pos, limit);
  }
  auto it = text.begin() + from_boundary;
  const auto end = text.begin() + limit;
  while (it < end && static_cast<size_t>(it - text.begin()) < pos) {
    utf8::next(it, end);
  }
  return it - text.begin();
}

// Last code point boundary at or before pos.
size_t prev_boundary(const std::string& text, size_t from_boundary, size_t pos, size_t limit,
                     bool valid_utf8) {
  if (!valid_utf8) {
    return std::min(pos, limit);
  }
  auto it = text.begin() + from_boundary;
  const auto end = text.begin() + limit;
  while (it < end) {
    auto next = it;
    utf8::next(next, end);
    if (static_cast<size_t>(next - text.begin()) > pos) {
      break;
    }
    it = next;
  }
  return it - text.begin();
}

}  // namespace

TextSpan trim_span(const std::string& text, TextSpan range) {
  size_t start = range.start;
  size_t end = range.end;
  while (start < end && is_space(text[start])) {
    ++start;
  }
  while (end > start && is_space(text[end - 1])) {
    --end;
  }
  if (start == end) {
    return {range.end, range.end};
  }
  return {start, end};
}

const std::vector<std::string>& StructuralSplitter::separators() {
  static const std::vector<std::string> kSeparators = {"\n\n", "\n", ". ", "! ", "? ", " "};
  return kSeparators;
}

StructuralSplitter::StructuralSplitter(size_t chunk_size, size_t chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("StructuralSplitter chunk_size must be positive");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw std::invalid_argument("StructuralSplitter chunk_overlap must be less than chunk_size");
  }
}

std::vector<TextSpan> StructuralSplitter::split(const std::string& text) const {
  return split(text, {0, text.size()});
}

std::vector<TextSpan> StructuralSplitter::split(const std::string& text, TextSpan range) const {
  if (range.end > text.size() || range.start > range.end) {
    throw std::out_of_range("StructuralSplitter range outside of text");
  }
  if (trim_span(text, range).length() == 0) {
    return {};
  }

  const bool valid_utf8 = utf8::is_valid(text.begin() + range.start, text.begin() + range.end);

  std::vector<TextSpan> pieces;
  split_recursive(text, range, 0, valid_utf8, pieces);

  std::vector<TextSpan> chunks;
  for (const TextSpan& merged : merge_pieces(text, pieces, valid_utf8)) {
    TextSpan trimmed = trim_span(text, merged);
    if (trimmed.length() > 0) {
      chunks.push_back(trimmed);
    }
  }
  return chunks;
}

void StructuralSplitter::split_recursive(const std::string& text,
                                         TextSpan range,
                                         size_t separator_index,
                                         bool valid_utf8,
                                         std::vector<TextSpan>& pieces) const {
  if (range.length() <= chunk_size_) {
    pieces.push_back(range);
    return;
  }

  const auto& seps = separators();
  for (size_t i = separator_index; i < seps.size(); ++i) {
    const std::string& sep = seps[i];

    // Separators stay attached to the end of the piece they terminate.
    std::vector<TextSpan> parts;
    size_t start = range.start;
    size_t pos = text.find(sep, start);
    while (pos != std::string::npos && pos + sep.size() < range.end) {
      const size_t cut = pos + sep.size();
      parts.push_back({start, cut});
      start = cut;
      pos = text.find(sep, start);
    }
    if (parts.empty()) {
      continue;
    }
    parts.push_back({start, range.end});

    for (const TextSpan& part : parts) {
      if (part.length() <= chunk_size_) {
        pieces.push_back(part);
      } else {
        split_recursive(text, part, i + 1, valid_utf8, pieces);
      }
    }
    return;
  }

  split_on_code_points(text, range, valid_utf8, pieces);
}

void StructuralSplitter::split_on_code_points(const std::string& text,
                                              TextSpan range,
                                              bool valid_utf8,
                                              std::vector<TextSpan>& pieces) const {
  size_t start = range.start;
  while (start < range.end) {
    if (range.end - start <= chunk_size_) {
      pieces.push_back({start, range.end});
      return;
    }
    size_t cut = prev_boundary(text, start, start + chunk_size_, range.end, valid_utf8);
    if (cut == start) {
      // chunk_size is narrower than a single code point
      cut = next_boundary(text, start, start + 1, range.end, valid_utf8);
    }
    pieces.push_back({start, cut});
    start = cut;
  }
}

std::vector<TextSpan> StructuralSplitter::merge_pieces(const std::string& text,
                                                       const std::vector<TextSpan>& pieces,
                                                       bool valid_utf8) const {
  std::vector<TextSpan> chunks;
  if (pieces.empty()) {
    return chunks;
  }

  TextSpan current = pieces.front();
  for (size_t i = 1; i < pieces.size(); ++i) {
    const TextSpan& piece = pieces[i];
    if (piece.end - current.start <= chunk_size_) {
      current.end = piece.end;
      continue;
    }
    chunks.push_back(current);

    // The overlap must start after the previous chunk's first visible byte
    // and leave room for the incoming piece.
    size_t lower = current.end > chunk_overlap_ ? current.end - chunk_overlap_ : 0;
    lower = std::max(lower, trim_span(text, current).start + 1);
    lower = std::max(lower, piece.end > chunk_size_ ? piece.end - chunk_size_ : 0);

    size_t start = overlap_start(text, lower, current, valid_utf8);
    if (start >= current.end) {
      start = piece.start;
    }
    current = {start, piece.end};
  }
  chunks.push_back(current);
  return chunks;
}

size_t StructuralSplitter::overlap_start(const std::string& text,
                                         size_t lower_bound,
                                         TextSpan previous,
                                         bool valid_utf8) const {
  if (lower_bound >= previous.end) {
    return previous.end;
  }
  for (size_t p = std::max(lower_bound, previous.start + 1); p < previous.end; ++p) {
    if (is_space(text[p - 1]) && !is_space(text[p])) {
      return p;
    }
  }
  return next_boundary(text, previous.start, lower_bound, previous.end, valid_utf8);
}

}  // namespace ragkit_core
