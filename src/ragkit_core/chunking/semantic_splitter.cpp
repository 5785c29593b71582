#include "ragkit_core/chunking/semantic_splitter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "ragkit_core/embedding/embedding_generator.hpp"

namespace ragkit_core {

double percentile(std::vector<double> values, double pct) {
  std::sort(values.begin(), values.end());
  if (values.size() == 1) {
    return values.front();
  }
  const double rank = (pct / 100.0) * static_cast<double>(values.size() - 1);
  const size_t lower = static_cast<size_t>(std::floor(rank));
  const size_t upper = std::min(lower + 1, values.size() - 1);
  const double fraction = rank - static_cast<double>(lower);
  return values[lower] + (values[upper] - values[lower]) * fraction;
}

double cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  const size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 1.0;
  }
  return 1.0 - dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

SemanticSplitter::SemanticSplitter(const EmbeddingGenerator& embedding_generator,
                                   SemanticOptions options)
    : embedding_generator_(embedding_generator), options_(options) {}

std::vector<TextSpan> SemanticSplitter::detect_sentences(const std::string& text) {
  std::vector<TextSpan> sentences;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    bool boundary = false;
    size_t end = i + 1;
    if (c == '\n') {
      boundary = true;
    } else if ((c == '.' || c == '!' || c == '?') &&
               (i + 1 == text.size() || text[i + 1] == ' ' || text[i + 1] == '\n' ||
                text[i + 1] == '\t' || text[i + 1] == '\r')) {
      boundary = true;
    }
    if (boundary) {
      TextSpan sentence = trim_span(text, {start, end});
      if (sentence.length() > 0) {
        sentences.push_back(sentence);
      }
      start = end;
    }
  }
  TextSpan tail = trim_span(text, {start, text.size()});
  if (tail.length() > 0) {
    sentences.push_back(tail);
  }
  return sentences;
}

std::optional<std::vector<TextSpan>> SemanticSplitter::split(
    const std::string& text, const async::CancellationToken& token) const {
  const std::vector<TextSpan> sentences = detect_sentences(text);
  if (sentences.size() < MIN_SENTENCES) {
    return std::nullopt;
  }

  const size_t window = static_cast<size_t>(options_.window);
  std::vector<std::string> windows;
  windows.reserve(sentences.size());
  for (size_t i = 0; i < sentences.size(); ++i) {
    const size_t first = i >= window ? i - window : 0;
    const size_t last = std::min(sentences.size() - 1, i + window);
    windows.push_back(
        text.substr(sentences[first].start, sentences[last].end - sentences[first].start));
  }

  std::vector<std::vector<float>> embeddings;
  try {
    embeddings = embedding_generator_.embed_texts(windows, token);
  } catch (const EmbeddingError& e) {
    std::cerr << "SemanticSplitter: embedding failed, falling back to structural splitting: "
              << e.what() << std::endl;
    return std::nullopt;
  }

  std::vector<double> distances;
  distances.reserve(embeddings.size() - 1);
  for (size_t i = 0; i + 1 < embeddings.size(); ++i) {
    distances.push_back(cosine_distance(embeddings[i], embeddings[i + 1]));
  }
  const double threshold = percentile(distances, options_.breakpoint_percentile);

  std::vector<TextSpan> groups;
  size_t group_start = 0;
  for (size_t i = 0; i < distances.size(); ++i) {
    if (distances[i] > threshold) {
      groups.push_back({sentences[group_start].start, sentences[i].end});
      group_start = i + 1;
    }
  }
  groups.push_back({sentences[group_start].start, sentences.back().end});
  return groups;
}

}  // namespace ragkit_core
