#include <glog/logging.h>
#include <filesystem>
#include <memory>
#include "common/python.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/adapter.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    codebench::RUN_DIR = std::filesystem::temp_directory_path() / "codebench-unit-test";
    std::filesystem::create_directories(codebench::RUN_DIR);
    interpreter = std::make_unique<codebench::python_interpreter>();
    codebench::register_default_adapters();
  }
  virtual void TearDown() {
    interpreter.reset();
    std::error_code ec;
    std::filesystem::remove_all(codebench::RUN_DIR, ec);
  }

 private:
  std::unique_ptr<codebench::python_interpreter> interpreter;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
