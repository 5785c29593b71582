#include "ragkit_core/retrieval/lexical_index.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace ragkit_core {

const std::unordered_set<std::string>& LexicalIndex::stop_words() {
  static const std::unordered_set<std::string> kStopWords = {
      "a",    "an",   "and",  "are",  "as",    "at",   "be",   "but",   "by",   "for",
      "if",   "in",   "into", "is",   "it",    "its",  "no",   "not",   "of",   "on",
      "or",   "such", "that", "the",  "their", "then", "there", "these", "they", "this",
      "to",   "was",  "were", "will", "with",  "what", "which", "who",   "how",  "do",
      "does", "from", "has",  "have", "had",   "been", "can",  "than",  "so",   "we"};
  return kStopWords;
}

std::vector<std::string> LexicalIndex::tokenize(const std::string& text) {
  std::vector<std::string> tokens;
  std::string current;
  auto flush = [&]() {
    if (!current.empty()) {
      if (stop_words().count(current) == 0) {
        tokens.push_back(current);
      }
      current.clear();
    }
  };

  for (char raw : text) {
    const unsigned char c = static_cast<unsigned char>(raw);
    if (c >= 0x80 || std::isalnum(c)) {
      current.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : raw);
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

std::vector<std::string> LexicalIndex::unique_terms(const std::vector<std::string>& terms) {
  std::vector<std::string> unique = terms;
  std::sort(unique.begin(), unique.end());
  unique.erase(std::unique(unique.begin(), unique.end()), unique.end());
  return unique;
}

void LexicalIndex::add_document(long long id, const std::string& text) {
  if (position_by_id_.count(id) != 0) {
    throw std::invalid_argument("Duplicate lexical document id " + std::to_string(id));
  }
  IndexedDocument document;
  document.id = id;
  for (const std::string& token : tokenize(text)) {
    ++document.term_frequency[token];
    ++document.length;
  }

  const size_t position = documents_.size();
  for (const auto& entry : document.term_frequency) {
    postings_[entry.first].push_back(position);
  }
  position_by_id_[id] = position;
  documents_.push_back(std::move(document));
  built_ = false;
}

void LexicalIndex::build() {
  const double n = static_cast<double>(documents_.size());
  idf_.clear();
  for (const auto& [term, positions] : postings_) {
    const double df = static_cast<double>(positions.size());
    // BM25 idf with +1 inside the log so it stays positive for common terms.
    idf_[term] = static_cast<float>(std::log(1.0 + (n - df + 0.5) / (df + 0.5)));
  }

  double total_length = 0.0;
  for (const auto& document : documents_) {
    total_length += document.length;
  }
  average_length_ = documents_.empty() ? 0.0f : static_cast<float>(total_length / n);
  built_ = true;
}

float LexicalIndex::idf(const std::string& term) const {
  auto it = idf_.find(term);
  return it == idf_.end() ? 0.0f : it->second;
}

float LexicalIndex::score_document(const IndexedDocument& document,
                                   const std::vector<std::string>& unique_query_terms) const {
  float score = 0.0f;
  const float length_ratio =
      average_length_ > 0.0f ? static_cast<float>(document.length) / average_length_ : 0.0f;
  for (const std::string& term : unique_query_terms) {
    auto tf_it = document.term_frequency.find(term);
    if (tf_it == document.term_frequency.end()) {
      continue;
    }
    const float tf = static_cast<float>(tf_it->second);
    const float normalized_tf = (tf * (k1 + 1.0f)) / (tf + k1 * (1.0f - b + b * length_ratio));
    score += idf(term) * normalized_tf;
  }
  return score;
}

float LexicalIndex::score(long long id, const std::vector<std::string>& query_terms) const {
  if (!built_) {
    throw std::logic_error("LexicalIndex::build() must run before scoring");
  }
  auto it = position_by_id_.find(id);
  if (it == position_by_id_.end()) {
    return 0.0f;
  }
  return score_document(documents_[it->second], unique_terms(query_terms));
}

std::vector<LexicalHit> LexicalIndex::search(const std::string& query, size_t limit) const {
  if (!built_) {
    throw std::logic_error("LexicalIndex::build() must run before searching");
  }
  const std::vector<std::string> terms = unique_terms(tokenize(query));

  std::unordered_set<size_t> candidates;
  for (const std::string& term : terms) {
    auto it = postings_.find(term);
    if (it != postings_.end()) {
      candidates.insert(it->second.begin(), it->second.end());
    }
  }

  std::vector<LexicalHit> hits;
  hits.reserve(candidates.size());
  for (size_t position : candidates) {
    const IndexedDocument& document = documents_[position];
    const float document_score = score_document(document, terms);
    if (document_score > 0.0f) {
      hits.push_back({document.id, document_score});
    }
  }

  std::sort(hits.begin(), hits.end(), [](const LexicalHit& a, const LexicalHit& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.id < b.id;
  });
  if (limit > 0 && hits.size() > limit) {
    hits.resize(limit);
  }
  return hits;
}

}  // namespace ragkit_core
