#include <glog/logging.h>
#include <stdlib.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/package_fixture.hpp"
#include "verifier/config.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 只打印警告及以上的日志
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = 1;
    if (getenv("DEBUG")) {
      FLAGS_minloglevel = 0;
      verifier::DEBUG = true;
    }
    verifier::COMPILE_COMMAND = verifier::SCRIPT_COMPILE_COMMAND;
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
