#include "ragkit_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace ragkit_cli {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw CliError("Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("Invalid number for " + flag + ": " + value);
    }
}

float parse_float(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        float parsed = std::stof(value, &used);
        if (used != value.size()) {
            throw CliError("Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("Invalid number for " + flag + ": " + value);
    }
}

std::string preview(const std::string& content, size_t max_chars) {
    if (content.size() <= max_chars) {
        return content;
    }
    return content.substr(0, max_chars) + "...";
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_(curl_easy_init()) {
    if (!curl_) {
        throw CliError("curl_easy_init failed");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else if (command == "hybrid" || command == "h") {
        options.command = Command::Hybrid;
    } else if (command == "lexical" || command == "l") {
        options.command = Command::Lexical;
    } else if (command == "list" || command == "ls") {
        options.command = Command::List;
        options.limit = 20;
    } else if (command == "get" || command == "g") {
        options.command = Command::Get;
    } else if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
    } else if (command == "reset") {
        options.command = Command::Reset;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    bool have_id = false;
    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];

        // Flags without a value
        if (flag == "--clean" || flag == "-c") {
            options.clean = true;
            continue;
        }
        if (flag == "--full") {
            options.full = true;
            continue;
        }

        // A bare word is the command's main argument
        if (flag.empty() || flag[0] != '-') {
            if (options.command == Command::Get) {
                options.document_id = parse_int("document id", flag);
                have_id = true;
            } else if (options.command == Command::Ingest) {
                options.directory = flag;
            } else {
                options.query = options.query.empty() ? flag : options.query + " " + flag;
            }
            continue;
        }

        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--limit" || flag == "-n") {
            options.limit = parse_int(flag, value);
        } else if (flag == "--weight" || flag == "-w") {
            options.text_weight = parse_float(flag, value);
            options.text_weight_set = true;
        } else if (flag == "--offset" || flag == "-o") {
            options.offset = parse_int(flag, value);
        } else if (flag == "--id") {
            options.document_id = parse_int(flag, value);
            have_id = true;
        } else if (flag == "--dir" || flag == "-d") {
            options.directory = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    switch (options.command) {
        case Command::Search:
        case Command::Hybrid:
        case Command::Lexical:
            if (options.query.empty()) {
                throw CliError(command + " requires a query. Usage: " + command + " --query <query>");
            }
            if (options.limit <= 0) {
                throw CliError("--limit must be positive");
            }
            break;
        case Command::Get:
            if (!have_id) {
                throw CliError("get requires a document id. Usage: get <id>");
            }
            break;
        case Command::Ingest:
            if (options.directory.empty()) {
                throw CliError("ingest requires a directory. Usage: ingest --dir <path> [--clean]");
            }
            break;
        default:
            break;
    }
    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Search:
            run_search(options, "/search", "Vector");
            break;
        case Command::Hybrid:
            run_search(options, "/search/hybrid", "Hybrid");
            break;
        case Command::Lexical:
            run_search(options, "/search/lexical", "Lexical");
            break;
        case Command::List:
            run_list(options);
            break;
        case Command::Get:
            run_get(options);
            break;
        case Command::Ingest:
            run_ingest(options);
            break;
        case Command::Reset:
            run_reset();
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::run_search(const CliOptions& options, const std::string& endpoint, const char* label) {
    std::cout << label << " search for: " << options.query << " (limit: " << options.limit << ")"
              << std::endl;
    nlohmann::json body = {{"query", options.query}, {"limit", options.limit}};
    if (options.command == Command::Hybrid && options.text_weight_set) {
        body["text_weight"] = options.text_weight;
    }
    print_search_response(request(endpoint, &body), options.full);
}

void CliHandler::run_list(const CliOptions& options) {
    print_document_list(request("/documents?limit=" + std::to_string(options.limit) +
                                    "&offset=" + std::to_string(options.offset),
                                nullptr));
}

void CliHandler::run_get(const CliOptions& options) {
    print_document(request("/documents/" + std::to_string(options.document_id), nullptr),
                   options.full);
}

void CliHandler::run_ingest(const CliOptions& options) {
    std::cout << "Ingesting documents from: " << options.directory
              << (options.clean ? " (cleaning existing data first)" : "") << std::endl;
    nlohmann::json body = {{"directory", options.directory}, {"clean", options.clean}};
    print_ingest_response(request("/ingest", &body));
}

void CliHandler::run_reset() {
    nlohmann::json body = nlohmann::json::object();
    nlohmann::json response = request("/admin/reset", &body);
    std::cout << response.value("message", std::string("Reset done")) << std::endl;
}

nlohmann::json CliHandler::request(const std::string& endpoint, const nlohmann::json* body) {
    const std::string url = build_url(endpoint);
    const std::string payload = body ? body->dump() : std::string();
    std::string response_buffer;
    curl_slist* headers = nullptr;

    CURL* curl = curl_.get();
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);
    if (res != CURLE_OK) {
        throw CliError("Request to " + url + " failed: " + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error&) {
        throw CliError("HTTP " + std::to_string(http_code) + " from " + url + " with a non-JSON body");
    }
    if (http_code != 200) {
        std::string message = reply.is_object() ? reply.value("error", std::string()) : std::string();
        throw CliError("HTTP " + std::to_string(http_code) + " from " + url +
                       (message.empty() ? "" : ": " + message));
    }
    return reply;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    std::string base = api_base_url_;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

void CliHandler::print_search_response(const nlohmann::json& response, bool full) {
    std::cout << "\n=== Search Results ===" << std::endl;
    if (response.value("degraded", false)) {
        std::cout << "(search degraded: " << response.value("error", std::string("unknown error"))
                  << ")" << std::endl;
    }
    if (!response.contains("results") || response["results"].empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }
    int rank = 1;
    for (const auto& result : response["results"]) {
        std::cout << rank++ << ". " << result.value("document_title", std::string("Untitled"))
                  << " [" << result.value("document_source", std::string()) << "] chunk "
                  << result.value("chunk_index", 0) << std::fixed << std::setprecision(3)
                  << " | score " << result.value("score", 0.0f)
                  << " (vector " << result.value("vector_score", 0.0f)
                  << ", lexical " << result.value("lexical_score", 0.0f) << ")" << std::endl;
        std::string content = result.value("content", std::string());
        std::cout << "   " << (full ? content : preview(content, 160)) << std::endl << std::endl;
    }
}

void CliHandler::print_document_list(const nlohmann::json& response) {
    const nlohmann::json& documents = response["data"]["documents"];
    if (documents.empty()) {
        std::cout << "No documents stored." << std::endl;
        return;
    }
    for (const auto& doc : documents) {
        std::cout << std::setw(6) << doc.value("id", 0LL) << "  "
                  << doc.value("title", std::string()) << " (" << doc.value("source", std::string())
                  << ", " << doc.value("chunk_count", 0) << " chunks, created "
                  << doc.value("created_at", std::string()) << ")" << std::endl;
    }
}

void CliHandler::print_document(const nlohmann::json& response, bool full) {
    const nlohmann::json& doc = response["data"];
    std::cout << std::string(80, '=') << std::endl;
    std::cout << doc.value("title", std::string()) << std::endl;
    std::cout << "Source: " << doc.value("source", std::string()) << std::endl;
    std::cout << "Created: " << doc.value("created_at", std::string()) << std::endl;
    std::cout << std::string(80, '-') << std::endl;
    for (const auto& chunk : doc["chunks"]) {
        std::cout << "#" << chunk.value("chunk_index", 0) << " [" << chunk.value("start_char", 0)
                  << ", " << chunk.value("end_char", 0) << ") ~" << chunk.value("token_count", 0)
                  << " tokens" << std::endl;
        std::string content = chunk.value("content", std::string());
        std::cout << (full ? content : preview(content, 200)) << std::endl << std::endl;
    }
    std::cout << std::string(80, '=') << std::endl;
}

void CliHandler::print_ingest_response(const nlohmann::json& response) {
    const nlohmann::json& data = response["data"];
    for (const auto& result : data["results"]) {
        std::cout << "  " << std::setw(9) << std::left << result.value("status", std::string())
                  << std::right << " " << result.value("source", std::string());
        if (result.value("chunks_created", 0) > 0) {
            std::cout << " (" << result.value("chunks_created", 0) << " chunks)";
        }
        for (const auto& error : result["errors"]) {
            std::cout << "\n      " << error.get<std::string>();
        }
        std::cout << std::endl;
    }
    std::cout << "Ingested " << data.value("documents", 0) << " documents, "
              << data.value("chunks_created", 0) << " chunks, " << data.value("failed", 0)
              << " failed" << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
ragkit CLI - document retrieval over your own files

Usage: ragkit_cli <command> [options]

Search Commands:
  search, s     Vector (semantic) search
  hybrid, h     Vector + keyword search
    --weight, -w <0..1>    Keyword weight (server default 0.3)
  lexical, l    Keyword (BM25) search
    --query, -q <text>     Query text (or pass it as plain words)
    --limit, -n <n>        Number of results (default 5)
    --full                 Print whole chunks

Document Commands:
  list, ls      List stored documents
    --limit, -n <n>        Page size (default 20)
    --offset, -o <n>       Page offset
  get, g <id>   Show a document and its chunks
  ingest, i     Ingest a folder of .md and .txt files
    --dir, -d <path>       Folder on the server machine
    --clean, -c            Remove all documents first
  reset         Remove all documents and chunks

Environment:
  RAGKIT_API_URL           API base URL (default http://127.0.0.1:3030)
)" << std::endl;
}

}  // namespace ragkit_cli
