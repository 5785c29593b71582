#pragma once

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace faiss {
struct IndexIDMap;
}

namespace ragkit_core {

/**
 * @class VectorIndex
 * @brief Exact cosine-similarity index over chunk embeddings.
 *
 * Vectors are L2-normalised on insert and searched with inner product
 * (faiss IndexFlatIP behind an IndexIDMap keyed by chunk id), so a search
 * score is the cosine similarity. Normalised copies are kept so callers can
 * score arbitrary ids against a query.
 */
class VectorIndex {
 public:
  explicit VectorIndex(size_t dimension);
  ~VectorIndex();

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  void add(long long id, const std::vector<float>& vector);

  // Best k ids by cosine similarity, ties by id ascending.
  std::vector<std::pair<long long, float>> search(const std::vector<float>& query, size_t k) const;

  // Cosine similarity of the stored vector for id; 0 when id is not indexed.
  float similarity(long long id, const std::vector<float>& normalized_query) const;

  std::vector<float> normalize(const std::vector<float>& vector) const;

  bool contains(long long id) const {
    return vectors_by_id_.count(id) > 0;
  }

  size_t size() const {
    return vectors_by_id_.size();
  }
  size_t dimension() const {
    return dimension_;
  }

 private:
  size_t dimension_;
  std::unique_ptr<faiss::IndexIDMap> index_;
  std::unordered_map<long long, std::vector<float>> vectors_by_id_;
};

}  // namespace ragkit_core
