#include "jazzy/signal-handler.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace jazzy {

class SignalHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override { SignalHandler::Enable(); }

  void TearDown() override {
    SignalHandler::Disable();
    SignalHandler::ResetStopRequest();
  }
};

TEST_F(SignalHandlerTest, NoStopRequestInitially) {
  EXPECT_FALSE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::LastSignal(), 0);
}

TEST_F(SignalHandlerTest, RaisedSignalRequestsStop) {
  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
  EXPECT_EQ(SignalHandler::LastSignal(), SIGTERM);
}

}  // namespace jazzy
