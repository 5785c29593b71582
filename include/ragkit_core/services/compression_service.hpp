#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ragkit_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CompressionService {
 public:
  /**
   * @brief Compresses a block of data using Zstandard.
   * @param data The data to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame; empty input gives an empty buffer.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a single Zstandard frame.
   * @throw CompressionError if the data is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace ragkit_core
