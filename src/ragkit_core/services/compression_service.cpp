#include "ragkit_core/services/compression_service.hpp"

#include <zstd.h>

namespace ragkit_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  const size_t worst_case_size = ZSTD_compressBound(data.size());
  std::vector<char> compressed_buffer(worst_case_size);

  const size_t compressed_size = ZSTD_compress(compressed_buffer.data(), compressed_buffer.size(),
                                               data.data(), data.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw CompressionError("ZSTD compression failed: " +
                           std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed_buffer.resize(compressed_size);
  return compressed_buffer;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long decompressed_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (decompressed_size == ZSTD_CONTENTSIZE_ERROR ||
      decompressed_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Failed to get decompressed size or data is not zstd format.");
  }

  std::string decompressed_buffer(decompressed_size, '\0');
  const size_t actual_size = ZSTD_decompress(decompressed_buffer.data(), decompressed_buffer.size(),
                                             compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual_size)) {
    throw CompressionError("ZSTD decompression failed: " +
                           std::string(ZSTD_getErrorName(actual_size)));
  }
  if (actual_size != decompressed_size) {
    throw CompressionError("ZSTD decompression produced " + std::to_string(actual_size) +
                           " bytes, frame header announced " + std::to_string(decompressed_size));
  }
  return decompressed_buffer;
}

}  // namespace ragkit_core
