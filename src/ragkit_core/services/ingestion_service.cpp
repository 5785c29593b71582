#include "ragkit_core/services/ingestion_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace ragkit_core {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
      .count();
}

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

std::string to_string(IngestionStatus status) {
  switch (status) {
    case IngestionStatus::Ingested:
      return "ingested";
    case IngestionStatus::Unchanged:
      return "unchanged";
    case IngestionStatus::Empty:
      return "empty";
    case IngestionStatus::Failed:
      return "failed";
  }
  return "failed";
}

IngestionService::IngestionService(std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                   std::shared_ptr<const ChunkSplitter> splitter,
                                   std::shared_ptr<const EmbeddingGenerator> embedding_generator,
                                   std::shared_ptr<DocumentStore> document_store)
    : extractor_factory_(std::move(extractor_factory)),
      splitter_(std::move(splitter)),
      embedding_generator_(std::move(embedding_generator)),
      document_store_(std::move(document_store)) {}

std::string IngestionService::source_for(const std::filesystem::path& file_path,
                                         const std::filesystem::path& documents_root) {
  if (documents_root.empty()) {
    return file_path.generic_string();
  }
  std::filesystem::path relative = file_path.lexically_relative(documents_root);
  if (relative.empty() || *relative.begin() == "..") {
    return file_path.generic_string();
  }
  return relative.generic_string();
}

IngestionResult IngestionService::ingest_document(const std::filesystem::path& file_path,
                                                  const std::filesystem::path& documents_root,
                                                  const async::CancellationToken& token) {
  token.throw_if_cancelled("extract");
  const ContentExtractor& extractor = extractor_factory_->get_extractor_for(file_path);
  ExtractedDocument extracted = extractor.extract(file_path);

  const std::string source = source_for(file_path, documents_root);
  nlohmann::json metadata = extracted.metadata;
  metadata["file_path"] = file_path.string();
  const std::string title = extracted.title.empty() ? source : extracted.title;

  return ingest_text(title, source, extracted.content, metadata, token);
}

IngestionResult IngestionService::ingest_text(const std::string& title,
                                              const std::string& source,
                                              const std::string& content,
                                              const nlohmann::json& metadata,
                                              const async::CancellationToken& token) {
  const auto start = std::chrono::steady_clock::now();
  IngestionResult result;
  result.title = title;
  result.source = source;

  if (is_blank(content)) {
    std::cerr << "IngestionService: " << source << " has no content, skipping" << std::endl;
    result.status = IngestionStatus::Empty;
    result.processing_time_ms = elapsed_ms(start);
    return result;
  }

  const std::string content_hash = ContentExtractor::compute_content_hash(content);
  const std::optional<Document> existing = document_store_->find_by_source(source);
  if (existing && existing->content_hash == content_hash) {
    std::cout << "IngestionService: " << source << " is unchanged" << std::endl;
    result.status = IngestionStatus::Unchanged;
    result.document_id = existing->id;
    result.processing_time_ms = elapsed_ms(start);
    return result;
  }

  std::cout << "IngestionService: processing " << title << std::endl;
  token.throw_if_cancelled("split");
  std::vector<Chunk> chunks = splitter_->split(content, title, source, metadata, token);
  if (chunks.empty()) {
    std::cerr << "IngestionService: no chunks created for " << title << std::endl;
    result.status = IngestionStatus::Empty;
    result.processing_time_ms = elapsed_ms(start);
    return result;
  }

  token.throw_if_cancelled("embed");
  std::vector<Chunk> embedded = embedding_generator_->embed(chunks, token);

  Document document;
  document.title = title;
  document.source = source;
  document.content = content;
  document.content_hash = content_hash;
  document.metadata = metadata;

  // The old version stays until the new one is fully embedded.
  token.throw_if_cancelled("save");
  if (existing) {
    std::cout << "IngestionService: " << source << " changed, replacing document "
              << existing->id << std::endl;
    result.document_id = document_store_->replace(existing->id, document, embedded, token);
  } else {
    result.document_id = document_store_->save(document, embedded, token);
  }
  result.chunks_created = static_cast<int>(embedded.size());
  result.status = IngestionStatus::Ingested;
  result.processing_time_ms = elapsed_ms(start);

  std::cout << "IngestionService: saved " << title << " as document " << result.document_id
            << " with " << result.chunks_created << " chunks in " << result.processing_time_ms
            << " ms" << std::endl;
  return result;
}

std::vector<std::filesystem::path> IngestionService::discover_documents(
    const std::filesystem::path& folder, bool recursive) const {
  if (!std::filesystem::is_directory(folder)) {
    throw ExtractionError("Documents folder not found: " + folder.string());
  }

  std::vector<std::filesystem::path> files;
  auto consider = [&](const std::filesystem::directory_entry& entry) {
    if (entry.is_regular_file() && extractor_factory_->can_handle(entry.path())) {
      files.push_back(entry.path());
    }
  };
  if (recursive) {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(folder)) {
      consider(entry);
    }
  } else {
    for (const auto& entry : std::filesystem::directory_iterator(folder)) {
      consider(entry);
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

void IngestionService::clean() {
  std::cout << "IngestionService: removing all documents and chunks" << std::endl;
  document_store_->delete_all();
}

}  // namespace ragkit_core
