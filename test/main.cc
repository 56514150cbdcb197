#include <filesystem>

#include "gtest/gtest.h"

#include "ruta/logging.h"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
  fs::current_path(RUTA_TEST_EXECUTION_DIR);
  ruta::s_verbosity = ruta::log_lvl::error;

  ::testing::InitGoogleTest(&argc, argv);
  auto test_result = RUN_ALL_TESTS();

  return test_result;
}
