#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "ragkit_core/async/cancellation_token.hpp"
#include "server.hpp"

namespace ragkit_core {
class SearchService;
class IngestionService;
struct SearchResult;
namespace async {
class WorkerPool;
}
}  // namespace ragkit_core

namespace ragkit_api {

class Routes {
 public:
  Routes(std::shared_ptr<ragkit_core::SearchService> search_service,
         std::shared_ptr<ragkit_core::IngestionService> ingestion_service,
         std::shared_ptr<ragkit_core::async::WorkerPool> worker_pool,
         float default_text_weight = 0.3f,
         ragkit_core::async::CancellationToken shutdown_token = {});
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Cancels the shutdown token and blocks until a running /ingest or
  // /admin/reset has returned. Later /ingest calls answer 503.
  void shutdown();

 private:
  std::shared_ptr<ragkit_core::SearchService> search_service_;
  std::shared_ptr<ragkit_core::IngestionService> ingestion_service_;
  std::shared_ptr<ragkit_core::async::WorkerPool> worker_pool_;
  float default_text_weight_;
  ragkit_core::async::CancellationToken shutdown_token_;
  // Serialises /ingest and /admin/reset.
  std::mutex write_mutex_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_lexical_search(const crow::request &req);
  crow::response handle_hybrid_search(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_get_document(const crow::request &req, long long document_id);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_reset(const crow::request &req);

  // Search failures are logged and answered with an empty, degraded result.
  crow::response create_degraded_search_response(const std::string &query, const std::string &error);
  crow::response create_search_response(const std::string &query,
                                        const std::vector<ragkit_core::SearchResult> &results);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string extract_search_query_from_request(const nlohmann::json &body);
  int extract_limit_from_request(const nlohmann::json &body, int default_limit);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace ragkit_api
