#include "ragkit_core/retrieval/retrieval_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <set>

namespace ragkit_core {

namespace {

// Hybrid candidate with the unclamped signals kept for tie-breaking.
struct Candidate {
  SearchResult result;
  float raw_vector = -std::numeric_limits<float>::infinity();
  float raw_lexical = 0.0f;
};

// Combined score, then the raw signals that carry weight, then chunk id. At
// text_weight 0 this is vector_search's order, at 1 lexical_search's.
bool ranks_before(const Candidate& a, const Candidate& b, float text_weight) {
  if (a.result.score != b.result.score) {
    return a.result.score > b.result.score;
  }
  if (text_weight < 1.0f && a.raw_vector != b.raw_vector) {
    return a.raw_vector > b.raw_vector;
  }
  if (text_weight > 0.0f && a.raw_lexical != b.raw_lexical) {
    return a.raw_lexical > b.raw_lexical;
  }
  return a.result.chunk_id < b.result.chunk_id;
}

}  // namespace

RetrievalEngine::RetrievalEngine(std::shared_ptr<DocumentStore> store, RetrievalOptions options)
    : store_(std::move(store)), options_(options) {
  if (!store_) {
    throw RetrievalError("RetrievalEngine requires a document store");
  }
  if (options_.candidate_multiplier == 0 || options_.max_limit <= 0) {
    throw RetrievalError("RetrievalEngine candidate multiplier and max limit must be positive");
  }
}

void RetrievalEngine::invalidate() {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_.reset();
}

std::shared_ptr<const RetrievalEngine::Snapshot> RetrievalEngine::build_snapshot(
    uint64_t generation) const {
  auto snapshot = std::make_shared<Snapshot>(store_->vector_dimension());
  snapshot->generation = generation;
  try {
    snapshot->rows = store_->load_index_rows();
  } catch (const StorageError& e) {
    throw RetrievalError("Failed to load chunks for retrieval: " + std::string(e.what()));
  }

  size_t skipped = 0;
  for (size_t i = 0; i < snapshot->rows.size(); ++i) {
    const IndexedChunk& row = snapshot->rows[i];
    snapshot->row_by_chunk_id[row.chunk_id] = i;
    snapshot->lexical.add_document(row.chunk_id, row.content);
    if (row.embedding.size() == store_->vector_dimension()) {
      snapshot->vectors.add(row.chunk_id, row.embedding);
    } else {
      ++skipped;
    }
  }
  snapshot->lexical.build();

  std::cout << "RetrievalEngine: indexed " << snapshot->rows.size() << " chunks (generation "
            << generation << ")" << std::endl;
  if (skipped > 0) {
    std::cerr << "RetrievalEngine: " << skipped
              << " chunks have no usable embedding and only match lexically" << std::endl;
  }
  return snapshot;
}

std::shared_ptr<const RetrievalEngine::Snapshot> RetrievalEngine::snapshot() const {
  const uint64_t generation = store_->generation();
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (snapshot_ && snapshot_->generation == generation) {
      return snapshot_;
    }
  }

  // Built outside the lock so running queries are not held up.
  std::shared_ptr<const Snapshot> fresh = build_snapshot(generation);

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  if (!snapshot_ || snapshot_->generation <= fresh->generation) {
    snapshot_ = fresh;
  }
  return fresh;
}

void RetrievalEngine::check_limit(int limit) const {
  if (limit <= 0 || limit > options_.max_limit) {
    throw RetrievalError("limit must be between 1 and " + std::to_string(options_.max_limit) +
                         ", got " + std::to_string(limit));
  }
}

void RetrievalEngine::check_query_embedding(const std::vector<float>& query_embedding) const {
  if (query_embedding.size() != store_->vector_dimension()) {
    throw RetrievalError("Query embedding has dimension " +
                         std::to_string(query_embedding.size()) + ", expected " +
                         std::to_string(store_->vector_dimension()));
  }
  for (float value : query_embedding) {
    if (!std::isfinite(value)) {
      throw RetrievalError("Query embedding contains a non-finite value");
    }
  }
}

SearchResult RetrievalEngine::make_result(const IndexedChunk& row, float score) {
  SearchResult result;
  result.chunk_id = row.chunk_id;
  result.document_id = row.document_id;
  result.chunk_index = row.chunk_index;
  result.content = row.content;
  result.score = clamp_score(score);
  result.metadata = row.metadata;
  result.document_title = row.document_title;
  result.document_source = row.document_source;
  return result;
}

std::vector<SearchResult> RetrievalEngine::vector_search(const std::vector<float>& query_embedding,
                                                         int limit) const {
  check_limit(limit);
  check_query_embedding(query_embedding);
  std::shared_ptr<const Snapshot> snap = snapshot();

  std::vector<SearchResult> results;
  for (const auto& [chunk_id, similarity] :
       snap->vectors.search(query_embedding, static_cast<size_t>(limit))) {
    SearchResult result = make_result(snap->rows[snap->row_by_chunk_id.at(chunk_id)], similarity);
    result.vector_score = result.score;
    results.push_back(std::move(result));
  }
  // Already ordered by raw similarity, which survives clamping to 0.
  return results;
}

std::vector<SearchResult> RetrievalEngine::lexical_search(const std::string& query_text,
                                                          int limit) const {
  check_limit(limit);
  std::shared_ptr<const Snapshot> snap = snapshot();

  std::vector<LexicalHit> hits = snap->lexical.search(query_text);
  if (hits.empty()) {
    return {};
  }
  // Normalised by the best raw score for this query over the whole corpus.
  const float best = hits.front().score;

  std::vector<SearchResult> results;
  const size_t count = std::min(hits.size(), static_cast<size_t>(limit));
  for (size_t i = 0; i < count; ++i) {
    SearchResult result =
        make_result(snap->rows[snap->row_by_chunk_id.at(hits[i].id)], hits[i].score / best);
    result.lexical_score = result.score;
    results.push_back(std::move(result));
  }
  return results;
}

std::vector<SearchResult> RetrievalEngine::hybrid_search(const std::vector<float>& query_embedding,
                                                         const std::string& query_text,
                                                         int limit,
                                                         float text_weight) const {
  check_limit(limit);
  if (!(text_weight >= 0.0f && text_weight <= 1.0f)) {
    throw RetrievalError("text_weight must be within [0, 1], got " + std::to_string(text_weight));
  }
  check_query_embedding(query_embedding);
  std::shared_ptr<const Snapshot> snap = snapshot();

  const size_t fetch = static_cast<size_t>(limit) * options_.candidate_multiplier;
  std::set<long long> candidates;
  for (const auto& hit : snap->vectors.search(query_embedding, fetch)) {
    candidates.insert(hit.first);
  }
  const std::vector<LexicalHit> lexical_hits = snap->lexical.search(query_text);
  const float best_lexical = lexical_hits.empty() ? 0.0f : lexical_hits.front().score;
  for (size_t i = 0; i < lexical_hits.size() && i < fetch; ++i) {
    candidates.insert(lexical_hits[i].id);
  }

  const std::vector<float> normalized_query = snap->vectors.normalize(query_embedding);
  const std::vector<std::string> query_terms = LexicalIndex::tokenize(query_text);

  std::vector<Candidate> ranked;
  ranked.reserve(candidates.size());
  for (long long chunk_id : candidates) {
    Candidate candidate;
    const bool has_vector = snap->vectors.contains(chunk_id);
    if (has_vector) {
      candidate.raw_vector = snap->vectors.similarity(chunk_id, normalized_query);
    }
    candidate.raw_lexical = snap->lexical.score(chunk_id, query_terms);

    // A pure signal only ranks what that signal's own search could return.
    if ((text_weight == 0.0f && !has_vector) ||
        (text_weight == 1.0f && candidate.raw_lexical <= 0.0f)) {
      continue;
    }

    const float vector_score = has_vector ? clamp_score(candidate.raw_vector) : 0.0f;
    const float lexical_score =
        best_lexical > 0.0f ? clamp_score(candidate.raw_lexical / best_lexical) : 0.0f;
    const float combined = (1.0f - text_weight) * vector_score + text_weight * lexical_score;

    candidate.result = make_result(snap->rows[snap->row_by_chunk_id.at(chunk_id)], combined);
    candidate.result.vector_score = vector_score;
    candidate.result.lexical_score = lexical_score;
    ranked.push_back(std::move(candidate));
  }

  std::sort(ranked.begin(), ranked.end(), [text_weight](const Candidate& a, const Candidate& b) {
    return ranks_before(a, b, text_weight);
  });

  std::vector<SearchResult> results;
  const size_t count = std::min(ranked.size(), static_cast<size_t>(limit));
  results.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    results.push_back(std::move(ranked[i].result));
  }
  return results;
}

}  // namespace ragkit_core
