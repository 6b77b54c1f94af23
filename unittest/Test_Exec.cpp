#include "TestHarness.hpp"
#include "Exec.hpp"
#include "SignalHandler.hpp"

#include <signal.h>
#include <cstring>

using namespace sf;

class ExecTest : public TempDirTest
{
protected:
  Buffer<char> output;

protected:
  void SetUp() override
  {
    TempDirTest::SetUp();
    BufferInit(&output);
  }

  void TearDown() override
  {
    BufferDestroy(&output, &heap);
    TempDirTest::TearDown();
  }

  ExecResult Run(const char* cmdline, int timeout = 0, bool capture = true)
  {
    ExecOptions options;
    options.m_CommandLine         = cmdline;
    options.m_LogPrefix           = "test";
    options.m_StartTimeoutSeconds = 10;
    options.m_TimeoutSeconds      = timeout;
    options.m_Heap                = &heap;
    options.m_CaptureStdout       = capture ? &output : nullptr;
    return ExecuteProcess(&options);
  }

  std::string Output() const
  {
    return std::string(output.m_Storage ? output.m_Storage : "", output.m_Size);
  }
};

TEST_F(ExecTest, CapturesStdout)
{
  ExecResult result = Run("echo hello; echo world >&2; printf tail");
  ASSERT_TRUE(ExecSucceeded(result));
  EXPECT_EQ("hello\ntail", Output());
}

TEST_F(ExecTest, LargeOutput)
{
  ExecResult result = Run("i=0; while [ $i -lt 5000 ]; do echo 0123456789abcdef; i=$((i+1)); done");
  ASSERT_TRUE(ExecSucceeded(result));
  EXPECT_EQ(5000u * 17u, output.m_Size);
}

TEST_F(ExecTest, ForwardedOutputIsNotCaptured)
{
  ExecResult result = Run("echo hello", 0, false);
  ASSERT_TRUE(ExecSucceeded(result));
  EXPECT_EQ(0u, output.m_Size);
}

TEST_F(ExecTest, ExitCode)
{
  ExecResult result = Run("exit 3");
  EXPECT_EQ(ExecStatus::kExited, result.m_Status);
  EXPECT_EQ(3, result.m_ReturnCode);
  EXPECT_FALSE(ExecSucceeded(result));
}

TEST_F(ExecTest, RunsInWorkingDirectory)
{
  WriteTestFile("marker.txt", "here");
  ExecResult result = Run("cat marker.txt");
  ASSERT_TRUE(ExecSucceeded(result));
  EXPECT_EQ("here", Output());
}

TEST_F(ExecTest, KilledBySignal)
{
  ExecResult result = Run("kill -9 $$");
  EXPECT_EQ(ExecStatus::kSignalled, result.m_Status);
  EXPECT_EQ(SIGKILL, result.m_Signal);
}

TEST_F(ExecTest, Timeout)
{
  uint64_t start = TimerGet();
  ExecResult result = Run("sleep 30", 1);
  EXPECT_EQ(ExecStatus::kTimeout, result.m_Status);
  EXPECT_LT(TimerDiffSeconds(start, TimerGet()), 10.0);
}

TEST_F(ExecTest, TimeoutKillsWholeProcessGroup)
{
  uint64_t start = TimerGet();
  ExecResult result = Run("sleep 30 & sleep 30 & wait", 1);
  EXPECT_EQ(ExecStatus::kTimeout, result.m_Status);
  EXPECT_LT(TimerDiffSeconds(start, TimerGet()), 10.0);
}

TEST_F(ExecTest, Interrupted)
{
  SignalSet("test");

  uint64_t start = TimerGet();
  ExecResult result = Run("sleep 30");
  EXPECT_EQ(ExecStatus::kInterrupted, result.m_Status);
  EXPECT_LT(TimerDiffSeconds(start, TimerGet()), 10.0);
}

class CommandTemplateTest : public ::testing::Test
{
protected:
  MemAllocHeap heap;
  Buffer<char> out;
  char         error[1024];

protected:
  void SetUp() override
  {
    HeapInit(&heap);
    BufferInit(&out);
    error[0] = '\0';
  }

  void TearDown() override
  {
    BufferDestroy(&out, &heap);
    HeapDestroy(&heap);
  }
};

TEST_F(CommandTemplateTest, Expands)
{
  TemplateVariable vars[] =
  {
    { "input", "/data/.snapfetch-job-full.txt" },
    { "dir",   "/data" },
  };

  ASSERT_TRUE(ExpandCommandTemplate(&out, &heap, "aria2c -d '{dir}' -i '{input}' --x={dir}", vars, 2, error));
  EXPECT_STREQ("aria2c -d '/data' -i '/data/.snapfetch-job-full.txt' --x=/data", out.m_Storage);
}

TEST_F(CommandTemplateTest, UnknownPlaceholdersKept)
{
  TemplateVariable vars[] = { { "url", "https://example.org/a" } };

  ASSERT_TRUE(ExpandCommandTemplate(&out, &heap, "curl {opts} '{url}' {url", vars, 1, error));
  EXPECT_STREQ("curl {opts} 'https://example.org/a' {url", out.m_Storage);
}

TEST_F(CommandTemplateTest, NoPlaceholders)
{
  ASSERT_TRUE(ExpandCommandTemplate(&out, &heap, "true", nullptr, 0, error));
  EXPECT_STREQ("true", out.m_Storage);
}

TEST_F(CommandTemplateTest, RejectsSingleQuote)
{
  TemplateVariable vars[] = { { "url", "https://example.org/a'; rm -rf ~; echo '" } };

  EXPECT_FALSE(ExpandCommandTemplate(&out, &heap, "curl '{url}'", vars, 1, error));
  EXPECT_NE(nullptr, strstr(error, "{url}"));
}
