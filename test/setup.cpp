#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>

spdlog::level::level_enum log_level;

class CodeboxEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(log_level);
  }
};

testing::Environment* const codebox_env = testing::AddGlobalTestEnvironment(new CodeboxEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
