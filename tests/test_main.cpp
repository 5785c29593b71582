#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>
#include <system_error>

namespace {

// Removes the shared scratch directory that holds per-test databases.
class ScratchDirectoryEnvironment : public ::testing::Environment {
 public:
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "ragkit_tests", ec);
    if (ec) {
      std::cerr << "ragkit_tests: could not remove scratch directory: " << ec.message()
                << std::endl;
    }
  }
};

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new ScratchDirectoryEnvironment());

  const int result = RUN_ALL_TESTS();
  std::cout << (result == 0 ? "ragkit: all tests passed" : "ragkit: test failures, see above")
            << std::endl;
  return result;
}
