#pragma once

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace ragkit_cli
{

  enum class Command
  {
    Search,
    Hybrid,
    Lexical,
    List,
    Get,
    Ingest,
    Reset,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    int limit = 5;
    float text_weight = 0.3f;
    bool text_weight_set = false;  // only sent when given, so the server default applies
    long long document_id = 0;
    std::string directory;
    bool clean = false;
    int offset = 0;
    bool full = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}
    const char *what() const noexcept override { return message_.c_str(); }

  private:
    std::string message_;
  };

  /**
   * Talks to a running ragkit_api over HTTP with one reused libcurl handle.
   * Non-200 replies become CliError carrying the server's "error" field.
   */
  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);

    // Throws CliError on unknown commands, missing values and bad numbers.
    CliOptions parse_arguments(int argc, char *argv[]);
    void execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url) { api_base_url_ = url; }
    std::string get_api_base_url() const { return api_base_url_; }

    // Joins the base URL and endpoint without doubling the slash.
    std::string build_url(const std::string &endpoint) const;

  private:
    struct CurlDeleter
    {
      void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
    };

    std::string api_base_url_;
    std::unique_ptr<CURL, CurlDeleter> curl_;

    void run_search(const CliOptions &options, const std::string &endpoint, const char *label);
    void run_list(const CliOptions &options);
    void run_get(const CliOptions &options);
    void run_ingest(const CliOptions &options);
    void run_reset();

    // A null body sends GET, anything else POSTs it as JSON.
    nlohmann::json request(const std::string &endpoint, const nlohmann::json *body);

    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    static void print_search_response(const nlohmann::json &response, bool full);
    static void print_document_list(const nlohmann::json &response);
    static void print_document(const nlohmann::json &response, bool full);
    static void print_ingest_response(const nlohmann::json &response);
    static void print_help();
  };

}
