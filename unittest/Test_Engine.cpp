#include "TestHarness.hpp"
#include "Engine.hpp"

#include <sys/stat.h>

using namespace sf;

class EngineTest : public TempDirTest
{
protected:
  EngineOptions options;
  Engine        engine;
  bool          engine_started = false;

protected:
  void SetUp() override
  {
    TempDirTest::SetUp();

    WriteFakeDownloader("fetch.sh");
    ASSERT_EQ(0, mkdir("remote", 0777));
    WriteTestFile("remote/part1.tar", "part one contents");
    WriteTestFile("remote/part2.tar", "part two contents");
    WriteManifest(
      Sha256Hex("part one contents") + "  part1.tar\n" +
      Sha256Hex("part two contents") + "  part2.tar\n");

    std::string config =
      std::string("Snapshot = {\n") +
      "  ManifestUrl = 'file://" + test_dir + "/remote/pruned.tar.manifest.txt',\n" +
      "  PartBaseUrl = 'file://" + test_dir + "/remote',\n" +
      "  DownloadCommand = \"sh '" + test_dir + "/fetch.sh' '{input}' '{dir}'\",\n" +
      "  MaxAttempts = 2,\n" +
      "  RetryDelay = 0,\n" +
      "  StartTimeout = 10,\n" +
      "  Threads = 2,\n" +
      "}\n";
    WriteTestFile("snapfetch.lua", config);

    EngineOptionsInit(&options);
    options.m_WorkingDir = test_dir;
  }

  void TearDown() override
  {
    StopEngine();
    TempDirTest::TearDown();
  }

  void WriteManifest(const std::string& text)
  {
    WriteTestFile("remote/pruned.tar.manifest.txt", text);
  }

  void StartEngine()
  {
    ASSERT_TRUE(EngineInit(&engine, &options));
    engine_started = true;
  }

  void StopEngine()
  {
    if (engine_started)
      EngineDestroy(&engine);
    engine_started = false;
  }

  EngineResult::Enum Sync()
  {
    StopEngine();
    StartEngine();
    return EngineSync(&engine);
  }

  int RunCount()
  {
    std::string runs = ReadTestFile("runs");
    int count = 0;
    for (char ch : runs)
      count += '\n' == ch;
    return count;
  }
};

TEST_F(EngineTest, LoadsConfiguration)
{
  StartEngine();
  EXPECT_EQ(2, engine.m_Config.m_MaxAttempts);
  EXPECT_EQ(2, engine.m_Queue.m_Config.m_ThreadCount);
  EXPECT_EQ(EngineState::kUnverified, engine.m_CurrentState);
}

TEST_F(EngineTest, CommandLineOverridesConfiguration)
{
  options.m_ThreadCount = 3;
  options.m_MaxAttempts = 7;
  StartEngine();
  EXPECT_EQ(7, engine.m_Config.m_MaxAttempts);
  EXPECT_EQ(3, engine.m_Queue.m_Config.m_ThreadCount);
}

TEST_F(EngineTest, BadConfigurationFailsInit)
{
  WriteTestFile("snapfetch.lua", "Snapshot = { MaxAttempts = 'many' }\n");
  EXPECT_FALSE(EngineInit(&engine, &options));
}

TEST_F(EngineTest, MissingWorkingDirFailsInit)
{
  options.m_WorkingDir = "/nonexistent/snapfetch";
  EXPECT_FALSE(EngineInit(&engine, &options));
}

TEST_F(EngineTest, SyncDownloadsAndValidates)
{
  ASSERT_EQ(EngineResult::kOk, Sync());
  EXPECT_EQ(EngineState::kAllValid, engine.m_CurrentState);

  EXPECT_EQ("part one contents", ReadTestFile("part1.tar"));
  EXPECT_EQ("part two contents", ReadTestFile("part2.tar"));
  EXPECT_TRUE(TestFileExists(".checksums_validated"));
  EXPECT_TRUE(TestFileExists(".snapshot_manifest.txt"));
  EXPECT_TRUE(TestFileExists(".checksum_cache.json"));
  EXPECT_FALSE(TestFileExists(".checksum_failures.txt"));
  EXPECT_EQ(1, RunCount());
}

TEST_F(EngineTest, SecondSyncIsANoOp)
{
  ASSERT_EQ(EngineResult::kOk, Sync());
  ASSERT_EQ(EngineResult::kOk, Sync());
  EXPECT_EQ(1, RunCount());
}

TEST_F(EngineTest, SyncSkipsPartsAlreadyPresent)
{
  WriteTestFile("part1.tar", "part one contents");
  WriteTestFile("part2.tar", "part two contents");

  ASSERT_EQ(EngineResult::kOk, Sync());
  EXPECT_EQ(0, RunCount());
}

TEST_F(EngineTest, SyncRecoversCorruptDownload)
{
  WriteTestFile("bad_runs", "1\n");

  ASSERT_EQ(EngineResult::kOk, Sync());
  EXPECT_EQ(2, RunCount());
  EXPECT_EQ("part two contents", ReadTestFile("part2.tar"));
  EXPECT_TRUE(TestFileExists(".checksums_validated"));
}

TEST_F(EngineTest, SyncExhausted)
{
  WriteTestFile("bad_runs", "100\n");

  ASSERT_EQ(EngineResult::kExhausted, Sync());
  EXPECT_EQ(EngineState::kExhausted, engine.m_CurrentState);
  EXPECT_EQ(3, RunCount());

  EXPECT_FALSE(TestFileExists("part1.tar"));
  EXPECT_FALSE(TestFileExists("part2.tar"));
  EXPECT_FALSE(TestFileExists(".checksums_validated"));
  EXPECT_TRUE(TestFileExists(".checksum_failures.txt"));
}

TEST_F(EngineTest, ManifestChangeResetsValidation)
{
  ASSERT_EQ(EngineResult::kOk, Sync());

  WriteTestFile("remote/part3.tar", "part three contents");
  WriteManifest(
    Sha256Hex("part one contents") + "  part1.tar\n" +
    Sha256Hex("part two contents") + "  part2.tar\n" +
    Sha256Hex("part three contents") + "  part3.tar\n");

  ASSERT_EQ(EngineResult::kOk, Sync());
  EXPECT_EQ(2, RunCount());
  EXPECT_EQ("part three contents", ReadTestFile("part3.tar"));
  EXPECT_TRUE(TestFileExists(".checksums_validated"));
}

TEST_F(EngineTest, EmptyManifestIsAnError)
{
  WriteManifest("\n");
  EXPECT_EQ(EngineResult::kSetupError, Sync());
}

TEST_F(EngineTest, RecoverNeedsStoredManifest)
{
  StartEngine();
  EXPECT_EQ(EngineResult::kSetupError, EngineRecover(&engine));
}

TEST_F(EngineTest, RecoverWithNothingToDo)
{
  ASSERT_EQ(EngineResult::kOk, Sync());

  StopEngine();
  StartEngine();
  EXPECT_EQ(EngineResult::kOk, EngineRecover(&engine));
  EXPECT_EQ(1, RunCount());
}

TEST_F(EngineTest, RecoverFetchesLedgerFiles)
{
  ASSERT_EQ(EngineResult::kOk, Sync());

  // Damage a part and record it the way a failed verification would.
  WriteTestFile("part2.tar", "damaged");
  WriteTestFile(".checksum_failures.txt", "part2.tar|" + Sha256Hex("part two contents") + "\n");
  RemoveFile(".checksums_validated");

  StopEngine();
  StartEngine();
  ASSERT_EQ(EngineResult::kOk, EngineRecover(&engine));
  EXPECT_EQ(2, RunCount());
  EXPECT_EQ("part two contents", ReadTestFile("part2.tar"));
  EXPECT_TRUE(TestFileExists(".checksums_validated"));
}

TEST_F(EngineTest, VerifyFiles)
{
  WriteTestFile("part1.tar", "part one contents");
  WriteTestFile("part2.tar", "damaged");

  std::string sum1 = Sha256Hex("part one contents");
  std::string sum2 = Sha256Hex("part two contents");

  VerifyRequest requests[] =
  {
    { "part1.tar", sum1.c_str() },
    { "part2.tar", sum2.c_str() },
  };

  StartEngine();
  EXPECT_EQ(EngineResult::kChecksumFailures, EngineVerifyFiles(&engine, requests, 2));
  EXPECT_EQ("part2.tar|" + sum2 + "\n", ReadTestFile(".checksum_failures.txt"));

  WriteTestFile("part2.tar", "part two contents");
  EXPECT_EQ(EngineResult::kOk, EngineVerifyFiles(&engine, requests, 2));
  EXPECT_TRUE(TestFileExists(".checksums_validated"));
  EXPECT_FALSE(TestFileExists(".checksum_failures.txt"));
}
