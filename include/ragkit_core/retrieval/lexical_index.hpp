#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ragkit_core {

struct LexicalHit {
  long long id = 0;
  float score = 0.0f;
};

/**
 * @class LexicalIndex
 * @brief Okapi BM25 index over chunk text.
 *
 * Call build() after the last add_document() and before searching. Scores
 * are raw BM25 values; normalisation is left to the caller.
 */
class LexicalIndex {
 public:
  float k1 = 1.2f;
  float b = 0.75f;

  void add_document(long long id, const std::string& text);
  void build();

  // Every document matching at least one query term, best first, ties by
  // id ascending. limit == 0 means no limit.
  std::vector<LexicalHit> search(const std::string& query, size_t limit = 0) const;

  // Raw BM25 of one document for already tokenized query terms.
  float score(long long id, const std::vector<std::string>& query_terms) const;

  float idf(const std::string& term) const;

  size_t size() const {
    return documents_.size();
  }
  bool is_built() const {
    return built_;
  }

  // Lower-cased alphanumeric runs, stop words removed. Bytes >= 0x80 count
  // as word characters so non-ASCII words survive intact.
  static std::vector<std::string> tokenize(const std::string& text);
  static const std::unordered_set<std::string>& stop_words();

 private:
  struct IndexedDocument {
    long long id = 0;
    std::unordered_map<std::string, unsigned> term_frequency;
    unsigned length = 0;
  };

  static std::vector<std::string> unique_terms(const std::vector<std::string>& terms);
  float score_document(const IndexedDocument& document,
                       const std::vector<std::string>& unique_query_terms) const;

  std::vector<IndexedDocument> documents_;
  std::unordered_map<long long, size_t> position_by_id_;
  std::unordered_map<std::string, std::vector<size_t>> postings_;
  std::unordered_map<std::string, float> idf_;
  float average_length_ = 0.0f;
  bool built_ = false;
};

}  // namespace ragkit_core
