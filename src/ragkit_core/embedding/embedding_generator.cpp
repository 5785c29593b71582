#include "ragkit_core/embedding/embedding_generator.hpp"

#include <chrono>
#include <optional>

#include "ragkit_core/async/concurrency_limiter.hpp"
#include "ragkit_core/llm/ollama_client.hpp"
#include "ragkit_core/utils/time_utils.hpp"

namespace ragkit_core {

EmbeddingGenerator::EmbeddingGenerator(std::shared_ptr<OllamaClient> client,
                                       EmbeddingOptions options,
                                       std::shared_ptr<async::ConcurrencyLimiter> limiter)
    : client_(std::move(client)), options_(options), limiter_(std::move(limiter)) {
  if (!client_) {
    throw EmbeddingError("EmbeddingGenerator requires an embedding client");
  }
  if (options_.max_batch_size == 0 || options_.max_batch_chars == 0 ||
      options_.max_text_chars == 0 || options_.dimension == 0) {
    throw EmbeddingError("Embedding batch limits and dimension must be positive");
  }
}

const std::string& EmbeddingGenerator::model() const {
  return client_->model();
}

std::vector<std::pair<size_t, size_t>> EmbeddingGenerator::plan_batches(
    const std::vector<std::string>& texts) const {
  std::vector<std::pair<size_t, size_t>> batches;
  size_t first = 0;
  size_t chars_in_batch = 0;
  for (size_t i = 0; i < texts.size(); ++i) {
    const size_t len = texts[i].size();
    const bool batch_full = (i - first) >= options_.max_batch_size ||
                            (i > first && chars_in_batch + len > options_.max_batch_chars);
    if (batch_full) {
      batches.emplace_back(first, i);
      first = i;
      chars_in_batch = 0;
    }
    chars_in_batch += len;
  }
  if (first < texts.size()) {
    batches.emplace_back(first, texts.size());
  }
  return batches;
}

void EmbeddingGenerator::check_vector(const std::vector<float>& vector, size_t position) const {
  if (vector.empty()) {
    throw EmbeddingError("Embedding backend returned an empty vector for text " +
                         std::to_string(position));
  }
  if (vector.size() != options_.dimension) {
    throw EmbeddingError("Embedding for text " + std::to_string(position) + " has dimension " +
                         std::to_string(vector.size()) + ", expected " +
                         std::to_string(options_.dimension));
  }
}

std::vector<std::vector<float>> EmbeddingGenerator::embed_texts(
    const std::vector<std::string>& texts, const async::CancellationToken& token) const {
  for (size_t i = 0; i < texts.size(); ++i) {
    if (texts[i].size() > options_.max_text_chars) {
      throw EmbeddingError("Text " + std::to_string(i) + " is " +
                           std::to_string(texts[i].size()) + " characters, limit is " +
                           std::to_string(options_.max_text_chars));
    }
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (const auto& [first, last] : plan_batches(texts)) {
    token.throw_if_cancelled("embedding batch");
    std::vector<std::string> batch(texts.begin() + first, texts.begin() + last);

    std::vector<std::vector<float>> batch_vectors;
    {
      std::optional<async::ConcurrencyLimiter::Permit> permit;
      if (limiter_) {
        permit.emplace(limiter_->acquire(token));
      }
      try {
        batch_vectors = client_->get_embeddings(batch);
      } catch (const std::exception& e) {
        throw EmbeddingError("Embedding backend call failed: " + std::string(e.what()));
      }
    }

    if (batch_vectors.size() != batch.size()) {
      throw EmbeddingError("Embedding backend returned " + std::to_string(batch_vectors.size()) +
                           " vectors for " + std::to_string(batch.size()) + " texts");
    }
    for (size_t i = 0; i < batch_vectors.size(); ++i) {
      check_vector(batch_vectors[i], first + i);
      vectors.push_back(std::move(batch_vectors[i]));
    }
  }
  return vectors;
}

std::vector<Chunk> EmbeddingGenerator::embed(const std::vector<Chunk>& chunks,
                                             const async::CancellationToken& token) const {
  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.content);
  }

  std::vector<std::vector<float>> vectors = embed_texts(texts, token);
  const std::string generated_at = to_iso8601(std::chrono::system_clock::now());

  std::vector<Chunk> embedded;
  embedded.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    Chunk chunk = chunks[i];
    chunk.vector_embedding = std::move(vectors[i]);
    chunk.metadata["embedding_model"] = model();
    chunk.metadata["embedding_generated_at"] = generated_at;
    embedded.push_back(std::move(chunk));
  }
  return embedded;
}

std::vector<float> EmbeddingGenerator::embed_query(const std::string& text,
                                                   const async::CancellationToken& token) const {
  std::vector<std::vector<float>> vectors = embed_texts({text}, token);
  return std::move(vectors.front());
}

}  // namespace ragkit_core
