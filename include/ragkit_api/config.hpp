#pragma once

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "ragkit_core/chunking/chunking_config.hpp"
#include "ragkit_core/embedding/embedding_generator.hpp"

namespace ragkit_api {

using ragkit_core::ConfigError;

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int num_workers;

  // Storage
  int pool_size;
  int pool_acquire_timeout_ms;

  // Embedding backend
  int embedding_concurrency;
  int embedding_batch_size;
  int embedding_batch_chars;

  // Chunking
  int chunk_size;
  int chunk_overlap;
  int min_chunk_size;
  int max_chunk_size;
  bool use_semantic_chunking;

  std::string documents_folder;
  double default_text_weight;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Config must be a JSON object");
    }
    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.metadata_db_path =
          json_config.value("metadata_db_path", std::string("./data/ragkit.db"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);
      config.num_workers = json_config.value("num_workers", 2);

      config.pool_size = json_config.value("pool_size", 4);
      config.pool_acquire_timeout_ms = json_config.value("pool_acquire_timeout_ms", 5000);

      config.embedding_concurrency = json_config.value("embedding_concurrency", 2);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 32);
      config.embedding_batch_chars = json_config.value("embedding_batch_chars", 60000);

      config.chunk_size =
          json_config.value("chunk_size", ragkit_core::ChunkingConfig::DEFAULT_CHUNK_SIZE);
      config.chunk_overlap =
          json_config.value("chunk_overlap", ragkit_core::ChunkingConfig::DEFAULT_CHUNK_OVERLAP);
      config.min_chunk_size =
          json_config.value("min_chunk_size", ragkit_core::ChunkingConfig::DEFAULT_MIN_CHUNK_SIZE);
      config.max_chunk_size =
          json_config.value("max_chunk_size", ragkit_core::ChunkingConfig::DEFAULT_MAX_CHUNK_SIZE);
      config.use_semantic_chunking = json_config.value("use_semantic_chunking", true);

      config.documents_folder = json_config.value("documents_folder", std::string("./documents"));
      config.default_text_weight = json_config.value("default_text_weight", 0.3);
    } catch (const nlohmann::json::type_error& e) {
      throw ConfigError(std::string("Config has a value of the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  void validate() const {
    const size_t colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw ConfigError("api_base_url must look like host:port");
    }
    if (metadata_db_path.empty()) {
      throw ConfigError("metadata_db_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw ConfigError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigError("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw ConfigError("embedding_dimension must be greater than 0");
    }
    if (num_workers <= 0) {
      throw ConfigError("num_workers must be greater than 0");
    }
    if (pool_size <= 0) {
      throw ConfigError("pool_size must be greater than 0");
    }
    if (pool_acquire_timeout_ms <= 0) {
      throw ConfigError("pool_acquire_timeout_ms must be greater than 0");
    }
    if (embedding_concurrency <= 0) {
      throw ConfigError("embedding_concurrency must be greater than 0");
    }
    if (embedding_batch_size <= 0 || embedding_batch_chars <= 0) {
      throw ConfigError("embedding batch limits must be greater than 0");
    }
    if (default_text_weight < 0.0 || default_text_weight > 1.0) {
      throw ConfigError("default_text_weight must be within [0, 1]");
    }
    // Throws ConfigError for inconsistent chunk sizes.
    chunking_config();
  }

  ragkit_core::ChunkingConfig chunking_config() const {
    return ragkit_core::ChunkingConfig(chunk_size, chunk_overlap, min_chunk_size, max_chunk_size,
                                       use_semantic_chunking);
  }

  ragkit_core::EmbeddingOptions embedding_options() const {
    ragkit_core::EmbeddingOptions options;
    options.max_batch_size = static_cast<size_t>(embedding_batch_size);
    options.max_batch_chars = static_cast<size_t>(embedding_batch_chars);
    options.dimension = static_cast<size_t>(embedding_dimension);
    return options;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }
};

}  // namespace ragkit_api
