#include "ragkit_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace ragkit_core {

OllamaClient::OllamaClient(const std::string &server_url, const std::string &model)
    : server_url_(server_url), model_(model) {
  ollama::setServerURL(server_url_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  std::vector<std::vector<float>> vectors = get_embeddings({text});
  return std::move(vectors.front());
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  try {
    ollama::request request = ollama::request::from_embedding(model_, texts.front());
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);
    return parse_embeddings(response.as_json(), texts.size());
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding request to " + server_url_ + " (model " + model_ +
                      ") failed: " + e.what());
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError(std::string("Malformed embedding reply: ") + e.what());
  }
}

std::vector<std::vector<float>> OllamaClient::parse_embeddings(const nlohmann::json &reply,
                                                               size_t expected) {
  if (reply.contains("error")) {
    throw OllamaError("Ollama returned an error: " + reply["error"].dump());
  }
  auto it = reply.find("embeddings");
  if (it == reply.end() || !it->is_array()) {
    throw OllamaError("Embedding reply has no \"embeddings\" array");
  }
  if (it->size() != expected) {
    throw OllamaError("Embedding reply has " + std::to_string(it->size()) + " vectors for " +
                      std::to_string(expected) + " inputs");
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(expected);
  for (const auto &embedding : *it) {
    if (!embedding.is_array() || embedding.empty()) {
      throw OllamaError("Embedding reply contains an empty or non-array vector");
    }
    vectors.push_back(embedding.get<std::vector<float>>());
  }
  return vectors;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace ragkit_core
