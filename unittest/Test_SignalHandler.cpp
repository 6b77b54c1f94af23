#include "SignalHandler.hpp"
#include "Thread.hpp"
#include "TestHarness.hpp"

#include <unistd.h>

using namespace sf;

class SignalWaitTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    SignalReset();
  }

  void TearDown() override
  {
    SignalReset();
  }
};

static ThreadRoutineReturnType SignalSoon(void*)
{
  usleep(100 * 1000);
  SignalSet("test");
  return nullptr;
}

TEST_F(SignalWaitTest, ZeroSecondsReturnsAtOnce)
{
  uint64_t start = TimerGet();
  EXPECT_TRUE(SignalWaitSeconds(0));
  EXPECT_LT(TimerDiffSeconds(start, TimerGet()), 0.5);
}

TEST_F(SignalWaitTest, SleepsWhenUndisturbed)
{
  uint64_t start = TimerGet();
  EXPECT_TRUE(SignalWaitSeconds(1));
  EXPECT_GE(TimerDiffSeconds(start, TimerGet()), 0.9);
}

TEST_F(SignalWaitTest, AlreadySignalled)
{
  SignalSet("test");
  EXPECT_FALSE(SignalWaitSeconds(30));
}

TEST_F(SignalWaitTest, WakesOnSignal)
{
  uint64_t start = TimerGet();

  ThreadId thread = ThreadStart(SignalSoon, nullptr, "sf-test-signal");
  EXPECT_FALSE(SignalWaitSeconds(30));
  ThreadJoin(thread);

  EXPECT_LT(TimerDiffSeconds(start, TimerGet()), 10.0);
  EXPECT_STREQ("test", SignalGetReason());
}
