#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "ragkit_api/routes.hpp"
#include "ragkit_core/async/service_provider.hpp"
#include "ragkit_core/async/worker_pool.hpp"
#include "ragkit_core/services/search_service.hpp"

namespace ragkit_tests {

using namespace ragkit_core;
using testing::_;
using testing::NiceMock;

// Drives the Crow app in-process; no socket is opened.
class RoutesTest : public DocumentStoreTestBase {
 protected:
  void SetUp() override {
    DocumentStoreTestBase::SetUp();
    documents_dir_ = TestUtilities::create_temp_dir("routes_tests");

    ollama_client_ = std::make_shared<NiceMock<MockOllamaClient>>();
    EmbeddingOptions options;
    options.dimension = kTestDimension;
    auto embedding_generator = std::make_shared<EmbeddingGenerator>(ollama_client_, options);
    auto retrieval_engine = std::make_shared<RetrievalEngine>(document_store_);
    auto extractor_factory = std::make_shared<ContentExtractorFactory>();
    auto splitter = std::make_shared<ChunkSplitter>(ChunkingConfig(200, 40, 20, 400, false));

    ServiceProvider::Services services;
    services.ollama_client = ollama_client_;
    services.embedding_generator = embedding_generator;
    services.document_store = document_store_;
    services.retrieval_engine = retrieval_engine;
    services.extractor_factory = extractor_factory;
    services.ingestion_service = std::make_shared<IngestionService>(
        extractor_factory, splitter, embedding_generator, document_store_);
    services.search_service =
        std::make_shared<SearchService>(embedding_generator, retrieval_engine, document_store_);
    provider_ = std::make_unique<ServiceProvider>(services);

    worker_pool_ = std::make_shared<async::WorkerPool>(2, *provider_);
    routes_ = std::make_unique<ragkit_api::Routes>(
        services.search_service, services.ingestion_service, worker_pool_, 0.3f, shutdown_token_);
    server_ = std::make_unique<ragkit_api::Server>("127.0.0.1", 0);
    routes_->register_routes(*server_);
    server_->get_app().validate();
  }

  void TearDown() override {
    routes_.reset();
    worker_pool_.reset();
    std::filesystem::remove_all(documents_dir_);
    DocumentStoreTestBase::TearDown();
  }

  crow::response call(crow::HTTPMethod method, const std::string& url,
                      const std::string& body = "") {
    crow::request req;
    req.method = method;
    req.url = url;
    req.raw_url = url;
    req.body = body;
    crow::response res;
    server_->get_app().handle_full(req, res);
    return res;
  }

  nlohmann::json ingest_folder() {
    TestUtilities::write_file(documents_dir_ / "pools.md",
                              "# Connection Pools\n\nPools hand out database connections and "
                              "take them back when the guard goes out of scope.");
    TestUtilities::write_file(documents_dir_ / "notes" / "bm25.txt",
                              "BM25 ranks documents by term frequency and inverse document "
                              "frequency with length normalisation.");
    nlohmann::json body = {{"directory", documents_dir_.string()}};
    crow::response res = call(crow::HTTPMethod::POST, "/ingest", body.dump());
    EXPECT_EQ(res.code, 200) << res.body;
    return nlohmann::json::parse(res.body);
  }

  std::filesystem::path documents_dir_;
  std::shared_ptr<NiceMock<MockOllamaClient>> ollama_client_;
  std::unique_ptr<ServiceProvider> provider_;
  std::shared_ptr<async::WorkerPool> worker_pool_;
  async::CancellationToken shutdown_token_;
  std::unique_ptr<ragkit_api::Routes> routes_;
  std::unique_ptr<ragkit_api::Server> server_;
};

TEST_F(RoutesTest, HealthCheck) {
  crow::response res = call(crow::HTTPMethod::GET, "/");
  EXPECT_EQ(res.code, 200);
  auto json = nlohmann::json::parse(res.body);
  EXPECT_EQ(json["status"], "healthy");
  EXPECT_TRUE(json["success"].get<bool>());
}

TEST_F(RoutesTest, IngestThenListAndGet) {
  nlohmann::json ingest = ingest_folder();
  EXPECT_EQ(ingest["data"]["documents"], 2);
  EXPECT_EQ(ingest["data"]["failed"], 0);
  EXPECT_EQ(ingest["data"]["results"][0]["status"], "ingested");
  EXPECT_EQ(ingest["data"]["results"][0]["source"], "notes/bm25.txt");

  crow::response list = call(crow::HTTPMethod::GET, "/documents");
  ASSERT_EQ(list.code, 200);
  auto documents = nlohmann::json::parse(list.body)["data"]["documents"];
  ASSERT_EQ(documents.size(), 2u);

  const long long id = documents[0]["id"].get<long long>();
  crow::response get = call(crow::HTTPMethod::GET, "/documents/" + std::to_string(id));
  ASSERT_EQ(get.code, 200);
  auto data = nlohmann::json::parse(get.body)["data"];
  EXPECT_EQ(data["id"], id);
  EXPECT_FALSE(data["chunks"].empty());
  EXPECT_TRUE(data["chunks"][0]["has_embedding"].get<bool>());
}

TEST_F(RoutesTest, ReingestReportsUnchanged) {
  ingest_folder();
  nlohmann::json again = ingest_folder();
  for (const auto& result : again["data"]["results"]) {
    EXPECT_EQ(result["status"], "unchanged");
  }
}

TEST_F(RoutesTest, LexicalSearchFindsIngestedText) {
  ingest_folder();
  nlohmann::json body = {{"query", "frequency"}, {"limit", 3}};
  crow::response res = call(crow::HTTPMethod::POST, "/search/lexical", body.dump());
  ASSERT_EQ(res.code, 200);
  auto json = nlohmann::json::parse(res.body);
  EXPECT_FALSE(json["degraded"].get<bool>());
  ASSERT_GE(json["count"].get<int>(), 1);
  EXPECT_EQ(json["results"][0]["document_source"], "notes/bm25.txt");
}

TEST_F(RoutesTest, SearchDegradesWhenEmbeddingFails) {
  ingest_folder();
  ON_CALL(*ollama_client_, get_embeddings(_))
      .WillByDefault(testing::Throw(OllamaError("server unavailable")));

  nlohmann::json body = {{"query", "pools"}};
  for (const std::string route : {"/search", "/search/hybrid"}) {
    crow::response res = call(crow::HTTPMethod::POST, route, body.dump());
    ASSERT_EQ(res.code, 200) << route;
    auto json = nlohmann::json::parse(res.body);
    EXPECT_TRUE(json["degraded"].get<bool>()) << route;
    EXPECT_EQ(json["count"], 0);
    EXPECT_TRUE(json["results"].empty());
    EXPECT_NE(json["error"].get<std::string>().find("server unavailable"), std::string::npos);
  }
}

TEST_F(RoutesTest, InvalidTextWeightDegrades) {
  nlohmann::json body = {{"query", "pools"}, {"text_weight", 3.0}};
  crow::response res = call(crow::HTTPMethod::POST, "/search/hybrid", body.dump());
  ASSERT_EQ(res.code, 200);
  EXPECT_TRUE(nlohmann::json::parse(res.body)["degraded"].get<bool>());
}

TEST_F(RoutesTest, BadRequestsAreRejected) {
  EXPECT_EQ(call(crow::HTTPMethod::POST, "/search", "not json").code, 400);
  EXPECT_EQ(call(crow::HTTPMethod::POST, "/search", "[1, 2]").code, 400);
  EXPECT_EQ(call(crow::HTTPMethod::POST, "/search/hybrid", "{}").code, 400);
  EXPECT_EQ(call(crow::HTTPMethod::POST, "/ingest", "{}").code, 400);

  nlohmann::json missing = {{"directory", (documents_dir_ / "missing").string()}};
  EXPECT_EQ(call(crow::HTTPMethod::POST, "/ingest", missing.dump()).code, 400);
}

TEST_F(RoutesTest, UnknownDocumentIs404) {
  EXPECT_EQ(call(crow::HTTPMethod::GET, "/documents/9999").code, 404);
}

TEST_F(RoutesTest, ResetRemovesEverything) {
  ingest_folder();
  crow::response res = call(crow::HTTPMethod::POST, "/admin/reset");
  ASSERT_EQ(res.code, 200);
  EXPECT_EQ(document_store_->document_count(), 0);

  nlohmann::json body = {{"query", "frequency"}};
  auto json = nlohmann::json::parse(call(crow::HTTPMethod::POST, "/search/lexical", body.dump()).body);
  EXPECT_EQ(json["count"], 0);
}

TEST_F(RoutesTest, IngestIsRefusedOnceShutdownStarts) {
  shutdown_token_.cancel();
  TestUtilities::write_file(documents_dir_ / "late.txt", "Written after the signal arrived.");
  nlohmann::json body = {{"directory", documents_dir_.string()}};
  crow::response res = call(crow::HTTPMethod::POST, "/ingest", body.dump());
  EXPECT_EQ(res.code, 503);
  EXPECT_EQ(document_store_->document_count(), 0);
}

TEST_F(RoutesTest, ShutdownKeepsIngestedDataAndBlocksNewIngestion) {
  ingest_folder();
  routes_->shutdown();
  EXPECT_TRUE(shutdown_token_.is_cancelled());

  TestUtilities::write_file(documents_dir_ / "late.txt", "Written during shutdown.");
  nlohmann::json body = {{"directory", documents_dir_.string()}};
  EXPECT_EQ(call(crow::HTTPMethod::POST, "/ingest", body.dump()).code, 503);
  EXPECT_EQ(document_store_->document_count(), 2);

  nlohmann::json query = {{"query", "frequency"}};
  crow::response search = call(crow::HTTPMethod::POST, "/search/lexical", query.dump());
  EXPECT_EQ(search.code, 200);
}

}  // namespace ragkit_tests
