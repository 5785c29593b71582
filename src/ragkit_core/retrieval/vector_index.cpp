#include "ragkit_core/retrieval/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ragkit_core {

namespace {

// faiss may order equal scores arbitrarily; fetch a little extra so ties at
// the cut-off can be re-sorted by id.
constexpr size_t kTieSlack = 16;

}  // namespace

VectorIndex::VectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw std::invalid_argument("VectorIndex dimension must be positive");
  }
  auto* base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension_));
  index_ = std::make_unique<faiss::IndexIDMap>(base_index);
  index_->own_fields = true;
}

VectorIndex::~VectorIndex() = default;

std::vector<float> VectorIndex::normalize(const std::vector<float>& vector) const {
  std::vector<float> normalized = vector;
  faiss::fvec_renorm_L2(dimension_, 1, normalized.data());
  return normalized;
}

void VectorIndex::add(long long id, const std::vector<float>& vector) {
  if (vector.size() != dimension_) {
    throw std::invalid_argument("Vector for id " + std::to_string(id) + " has dimension " +
                                std::to_string(vector.size()) + ", index expects " +
                                std::to_string(dimension_));
  }
  std::vector<float> normalized = normalize(vector);
  const faiss::idx_t faiss_id = static_cast<faiss::idx_t>(id);
  index_->add_with_ids(1, normalized.data(), &faiss_id);
  vectors_by_id_[id] = std::move(normalized);
}

std::vector<std::pair<long long, float>> VectorIndex::search(const std::vector<float>& query,
                                                             size_t k) const {
  if (query.size() != dimension_) {
    throw std::invalid_argument("Query vector has dimension " + std::to_string(query.size()) +
                                ", index expects " + std::to_string(dimension_));
  }
  std::vector<std::pair<long long, float>> hits;
  if (k == 0 || index_->ntotal == 0) {
    return hits;
  }

  const std::vector<float> normalized = normalize(query);
  const faiss::idx_t fetch =
      std::min<faiss::idx_t>(index_->ntotal, static_cast<faiss::idx_t>(k + kTieSlack));
  std::vector<float> distances(fetch);
  std::vector<faiss::idx_t> labels(fetch);
  index_->search(1, normalized.data(), fetch, distances.data(), labels.data());

  for (faiss::idx_t i = 0; i < fetch; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    // Same kernel as similarity().
    const long long id = static_cast<long long>(labels[i]);
    hits.emplace_back(id, similarity(id, normalized));
  }
  std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return a.first < b.first;
  });
  if (hits.size() > k) {
    hits.resize(k);
  }
  return hits;
}

float VectorIndex::similarity(long long id, const std::vector<float>& normalized_query) const {
  auto it = vectors_by_id_.find(id);
  if (it == vectors_by_id_.end() || normalized_query.size() != dimension_) {
    return 0.0f;
  }
  return faiss::fvec_inner_product(normalized_query.data(), it->second.data(), dimension_);
}

}  // namespace ragkit_core
