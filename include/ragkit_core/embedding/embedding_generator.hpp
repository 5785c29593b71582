#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/types/chunk.hpp"

namespace ragkit_core {

class OllamaClient;

namespace async {
class ConcurrencyLimiter;
}

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct EmbeddingOptions {
  size_t max_batch_size = 32;
  size_t max_batch_chars = 60000;
  size_t max_text_chars = 16000;
  size_t dimension = 1024;
};

/**
 * @class EmbeddingGenerator
 * @brief Turns chunk text into fixed-length vectors through the embedding backend.
 *
 * Texts are packed into as few backend calls as the batch limits allow, input
 * order is preserved, and a single bad response fails the whole call. Backend
 * calls take a permit from the shared ConcurrencyLimiter when one is set.
 */
class EmbeddingGenerator {
 public:
  EmbeddingGenerator(std::shared_ptr<OllamaClient> client,
                     EmbeddingOptions options = {},
                     std::shared_ptr<async::ConcurrencyLimiter> limiter = nullptr);

  // Returns new chunk records carrying vectors plus embedding_model and
  // embedding_generated_at metadata.
  std::vector<Chunk> embed(const std::vector<Chunk>& chunks,
                           const async::CancellationToken& token = {}) const;

  std::vector<std::vector<float>> embed_texts(const std::vector<std::string>& texts,
                                              const async::CancellationToken& token = {}) const;

  std::vector<float> embed_query(const std::string& text,
                                 const async::CancellationToken& token = {}) const;

  // Index ranges [first, last) of each backend call for the given texts.
  std::vector<std::pair<size_t, size_t>> plan_batches(const std::vector<std::string>& texts) const;

  const std::string& model() const;
  size_t dimension() const {
    return options_.dimension;
  }

 private:
  void check_vector(const std::vector<float>& vector, size_t position) const;

  std::shared_ptr<OllamaClient> client_;
  EmbeddingOptions options_;
  std::shared_ptr<async::ConcurrencyLimiter> limiter_;
};

}  // namespace ragkit_core
