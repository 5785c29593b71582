#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ragkit_core {

// Raised for unreachable servers, unknown models and malformed /api/embed replies.
class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Thin wrapper over ollama-hpp's embedding endpoint.
 *
 * Construction only records the server URL and model; nothing is sent until
 * the first embedding call. The virtual calls are the seam tests mock.
 */
class OllamaClient {
 public:
  OllamaClient(const std::string &server_url, const std::string &model);
  virtual ~OllamaClient() = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::vector<float> get_embedding(const std::string &text);

  // Sends every text in one request. The reply must hold exactly one vector
  // per input, in input order.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  virtual bool is_server_available();

  const std::string &model() const {
    return model_;
  }
  const std::string &server_url() const {
    return server_url_;
  }

 private:
  static std::vector<std::vector<float>> parse_embeddings(const nlohmann::json &reply,
                                                          size_t expected);

  std::string server_url_;
  std::string model_;
};

}  // namespace ragkit_core
