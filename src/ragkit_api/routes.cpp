#include "ragkit_api/routes.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "ragkit_core/async/worker_pool.hpp"
#include "ragkit_core/services/ingestion_service.hpp"
#include "ragkit_core/services/search_service.hpp"
#include "ragkit_core/utils/time_utils.hpp"

namespace ragkit_api {

namespace {

// Request body or parameter the client got wrong; answered with 400.
class BadRequest : public std::exception {
 public:
  explicit BadRequest(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

nlohmann::json search_result_to_json(const ragkit_core::SearchResult &result) {
  nlohmann::json json;
  json["chunk_id"] = result.chunk_id;
  json["document_id"] = result.document_id;
  json["chunk_index"] = result.chunk_index;
  json["content"] = result.content;
  json["score"] = result.score;
  json["vector_score"] = result.vector_score;
  json["lexical_score"] = result.lexical_score;
  json["metadata"] = result.metadata;
  json["document_title"] = result.document_title;
  json["document_source"] = result.document_source;
  return json;
}

int int_param(const crow::request &req, const char *name, int default_value) {
  const char *raw = req.url_params.get(name);
  if (raw == nullptr) {
    return default_value;
  }
  try {
    return std::stoi(raw);
  } catch (const std::logic_error &) {
    throw BadRequest(std::string("Invalid integer for '") + name + "': " + raw);
  }
}

}  // namespace

Routes::Routes(std::shared_ptr<ragkit_core::SearchService> search_service,
               std::shared_ptr<ragkit_core::IngestionService> ingestion_service,
               std::shared_ptr<ragkit_core::async::WorkerPool> worker_pool,
               float default_text_weight,
               ragkit_core::async::CancellationToken shutdown_token)
    : search_service_(std::move(search_service)),
      ingestion_service_(std::move(ingestion_service)),
      worker_pool_(std::move(worker_pool)),
      default_text_weight_(default_text_weight),
      shutdown_token_(std::move(shutdown_token)) {}

void Routes::shutdown() {
  shutdown_token_.cancel();
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::cout << "Routes: no ingestion in progress" << std::endl;
}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/search/lexical")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_lexical_search(req); });

  CROW_ROUTE(app, "/search/hybrid")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_hybrid_search(req); });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<int>")
  ([this](const crow::request &req, int64_t document_id) {
    return handle_get_document(req, static_cast<long long>(document_id));
  });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/admin/reset")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) { return handle_reset(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("ragkit API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::create_search_response(
    const std::string &query, const std::vector<ragkit_core::SearchResult> &results) {
  nlohmann::json json_results = nlohmann::json::array();
  for (const auto &result : results) {
    json_results.push_back(search_result_to_json(result));
  }
  nlohmann::json response;
  response["query"] = query;
  response["results"] = json_results;
  response["count"] = json_results.size();
  response["degraded"] = false;
  return create_json_response(response);
}

crow::response Routes::create_degraded_search_response(const std::string &query,
                                                       const std::string &error) {
  std::cerr << "Search failed for '" << query << "', returning no results: " << error << std::endl;
  nlohmann::json response;
  response["query"] = query;
  response["results"] = nlohmann::json::array();
  response["count"] = 0;
  response["degraded"] = true;
  response["error"] = error;
  return create_json_response(response);
}

crow::response Routes::handle_search(const crow::request &req) {
  std::string query;
  int limit = 10;
  try {
    nlohmann::json body = parse_json_body(req.body);
    query = extract_search_query_from_request(body);
    limit = extract_limit_from_request(body, 10);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  std::cout << "Vector search for: " << query << " with limit: " << limit << std::endl;
  try {
    return create_search_response(query, search_service_->vector_search(query, limit));
  } catch (const std::exception &e) {
    return create_degraded_search_response(query, e.what());
  }
}

crow::response Routes::handle_lexical_search(const crow::request &req) {
  std::string query;
  int limit = 10;
  try {
    nlohmann::json body = parse_json_body(req.body);
    query = extract_search_query_from_request(body);
    limit = extract_limit_from_request(body, 10);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  std::cout << "Lexical search for: " << query << " with limit: " << limit << std::endl;
  try {
    return create_search_response(query, search_service_->lexical_search(query, limit));
  } catch (const std::exception &e) {
    return create_degraded_search_response(query, e.what());
  }
}

crow::response Routes::handle_hybrid_search(const crow::request &req) {
  std::string query;
  int limit = 10;
  float text_weight = default_text_weight_;
  try {
    nlohmann::json body = parse_json_body(req.body);
    query = extract_search_query_from_request(body);
    limit = extract_limit_from_request(body, 10);
    text_weight = body.value("text_weight", default_text_weight_);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  std::cout << "Hybrid search for: " << query << " with limit: " << limit
            << ", text_weight: " << text_weight << std::endl;
  try {
    return create_search_response(query,
                                  search_service_->hybrid_search(query, limit, text_weight));
  } catch (const std::exception &e) {
    return create_degraded_search_response(query, e.what());
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    const int limit = int_param(req, "limit", 20);
    const int offset = int_param(req, "offset", 0);
    std::cout << "Listing documents (limit " << limit << ", offset " << offset << ")" << std::endl;

    nlohmann::json documents = nlohmann::json::array();
    for (const auto &summary : search_service_->list_documents(limit, offset)) {
      nlohmann::json doc;
      doc["id"] = summary.id;
      doc["title"] = summary.title;
      doc["source"] = summary.source;
      doc["metadata"] = summary.metadata;
      doc["chunk_count"] = summary.chunk_count;
      doc["created_at"] = ragkit_core::to_iso8601(summary.created_at);
      doc["updated_at"] = ragkit_core::to_iso8601(summary.updated_at);
      documents.push_back(doc);
    }

    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_document(const crow::request &, long long document_id) {
  try {
    std::cout << "Getting document " << document_id << std::endl;
    auto found = search_service_->get_document(document_id);
    if (!found) {
      return create_json_response(create_error_response("Document not found"), 404);
    }

    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &chunk : found->chunks) {
      nlohmann::json chunk_json;
      chunk_json["id"] = chunk.id;
      chunk_json["chunk_index"] = chunk.chunk_index;
      chunk_json["start_char"] = chunk.start_char;
      chunk_json["end_char"] = chunk.end_char;
      chunk_json["content"] = chunk.content;
      chunk_json["token_count"] = chunk.token_count;
      chunk_json["has_embedding"] = chunk.has_embedding();
      chunk_json["metadata"] = chunk.metadata;
      chunks.push_back(chunk_json);
    }

    const ragkit_core::Document &document = found->document;
    nlohmann::json data;
    data["id"] = document.id;
    data["title"] = document.title;
    data["source"] = document.source;
    data["content"] = document.content;
    data["content_hash"] = document.content_hash;
    data["metadata"] = document.metadata;
    data["created_at"] = ragkit_core::to_iso8601(document.created_at);
    data["updated_at"] = ragkit_core::to_iso8601(document.updated_at);
    data["chunks"] = chunks;

    return create_json_response(create_success_response("Document retrieved successfully", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    const std::string directory = body.value("directory", std::string());
    const bool clean = body.value("clean", false);
    if (directory.empty()) {
      throw BadRequest("Missing 'directory' in request body");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (shutdown_token_.is_cancelled()) {
      return create_json_response(create_error_response("Server is shutting down"), 503);
    }
    std::cout << "Ingesting documents from " << directory << (clean ? " (clean)" : "")
              << std::endl;
    std::vector<std::filesystem::path> paths = ingestion_service_->discover_documents(directory);
    if (clean) {
      ingestion_service_->clean();
    }

    std::vector<ragkit_core::IngestionResult> results = worker_pool_->ingest_all(
        paths, directory, shutdown_token_, [](size_t done, size_t total) {
          std::cout << "Ingestion progress: " << done << "/" << total << std::endl;
        });

    nlohmann::json json_results = nlohmann::json::array();
    int chunks_created = 0;
    int failed = 0;
    for (const auto &result : results) {
      nlohmann::json json;
      json["status"] = ragkit_core::to_string(result.status);
      json["document_id"] = result.document_id;
      json["title"] = result.title;
      json["source"] = result.source;
      json["chunks_created"] = result.chunks_created;
      json["processing_time_ms"] = result.processing_time_ms;
      json["errors"] = result.errors;
      json_results.push_back(json);
      chunks_created += result.chunks_created;
      if (result.status == ragkit_core::IngestionStatus::Failed) {
        ++failed;
      }
    }

    nlohmann::json data;
    data["documents"] = results.size();
    data["chunks_created"] = chunks_created;
    data["failed"] = failed;
    data["results"] = json_results;
    return create_json_response(create_success_response("Ingestion finished", data));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const ragkit_core::ExtractionError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_reset(const crow::request &) {
  try {
    std::lock_guard<std::mutex> lock(write_mutex_);
    ingestion_service_->clean();
    return create_json_response(create_success_response("All documents removed"));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_reset: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  nlohmann::json json = nlohmann::json::parse(body);
  if (!json.is_object()) {
    throw BadRequest("Request body must be a JSON object");
  }
  return json;
}

std::string Routes::extract_search_query_from_request(const nlohmann::json &body) {
  std::string query = body.value("query", std::string());
  if (query.empty()) {
    throw BadRequest("Missing 'query' in request body");
  }
  return query;
}

int Routes::extract_limit_from_request(const nlohmann::json &body, int default_limit) {
  return body.value("limit", default_limit);
}

}  // namespace ragkit_api
