#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csignal>

#include "sockd/SignalRouter.hpp"

using namespace testing;

namespace {

bool isBlocked(int signum) {
  sigset_t current;
  pthread_sigmask(SIG_SETMASK, nullptr, &current);
  return sigismember(&current, signum) == 1;
}

}  // namespace

TEST(SignalRouterTest, RegisterInvalidSignal) {
  sockd::SignalRouter router;
  EXPECT_THROW(router.registerHandler(SIGKILL, [](int) {}),
               std::invalid_argument);
  EXPECT_THROW(router.registerHandler(SIGSTOP, [](int) {}),
               std::invalid_argument);
  EXPECT_THROW(router.registerHandler(0, [](int) {}), std::invalid_argument);
  EXPECT_THROW(router.registerHandler(NSIG, [](int) {}),
               std::invalid_argument);
}

TEST(SignalRouterTest, HandlerInvocation) {
  MockFunction<void(int)> handler;
  EXPECT_CALL(handler, Call(SIGUSR1)).Times(1);

  sockd::SignalRouter router;
  router.registerHandler(SIGUSR1, handler.AsStdFunction());
  ASSERT_EQ(raise(SIGUSR1), 0);

  EXPECT_TRUE(router.waitAndDispatch(std::chrono::seconds(1)));
}

TEST(SignalRouterTest, MultipleHandlersRunInRegistrationOrder) {
  MockFunction<void(int)> first, second;
  {
    InSequence seq;
    EXPECT_CALL(first, Call(SIGUSR2));
    EXPECT_CALL(second, Call(SIGUSR2));
  }

  sockd::SignalRouter router;
  router.registerHandler(SIGUSR2, first.AsStdFunction());
  router.registerHandler(SIGUSR2, second.AsStdFunction());
  ASSERT_EQ(raise(SIGUSR2), 0);

  EXPECT_TRUE(router.waitAndDispatch(std::chrono::seconds(1)));
}

TEST(SignalRouterTest, RoutesOnlyToMatchingSignal) {
  MockFunction<void(int)> onTerm, onUsr1;
  EXPECT_CALL(onTerm, Call(_)).Times(0);
  EXPECT_CALL(onUsr1, Call(SIGUSR1)).Times(1);

  sockd::SignalRouter router;
  router.registerHandler(SIGTERM, onTerm.AsStdFunction());
  router.registerHandler(SIGUSR1, onUsr1.AsStdFunction());
  ASSERT_EQ(raise(SIGUSR1), 0);

  EXPECT_EQ(router.dispatch(), 1);
}

TEST(SignalRouterTest, UnregisteredSignalIsDrainedWithoutHandler) {
  MockFunction<void(int)> handler;
  EXPECT_CALL(handler, Call(_)).Times(0);

  sockd::SignalRouter router;
  router.registerHandler(SIGUSR1, handler.AsStdFunction());
  router.unregisterHandler(SIGUSR1);
  ASSERT_EQ(raise(SIGUSR1), 0);

  EXPECT_EQ(router.dispatch(), 1);
}

TEST(SignalRouterTest, WaitTimesOutWithoutSignal) {
  sockd::SignalRouter router;
  router.registerHandler(SIGUSR1, [](int) {});
  EXPECT_FALSE(router.waitAndDispatch(std::chrono::milliseconds(50)));
  EXPECT_EQ(router.dispatch(), 0);
}

TEST(SignalRouterTest, MaskRestoredOnDestruction) {
  ASSERT_FALSE(isBlocked(SIGQUIT));
  {
    sockd::SignalRouter router;
    router.registerHandler(SIGQUIT, [](int) {});
    EXPECT_TRUE(isBlocked(SIGQUIT));
  }
  EXPECT_FALSE(isBlocked(SIGQUIT));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
