#include "TestHarness.hpp"
#include "Downloader.hpp"
#include "SignalHandler.hpp"
#include "Stats.hpp"

#include <sys/stat.h>

using namespace sf;

class DownloaderTest : public TempDirTest
{
protected:
  char             remote[kMaxPathLength];
  char             urls[2][kMaxPathLength];
  DownloadRequest  requests[2];
  DownloaderConfig config;

protected:
  void SetUp() override
  {
    TempDirTest::SetUp();

    WriteFakeDownloader("fetch.sh");

    snprintf(remote, sizeof remote, "%s/remote", test_dir);
    ASSERT_EQ(0, mkdir(remote, 0777));

    WriteTestFile("remote/part1.tar", "first part");
    WriteTestFile("remote/part2.tar", "second part");

    snprintf(urls[0], sizeof urls[0], "%s/part1.tar", remote);
    snprintf(urls[1], sizeof urls[1], "%s/part2.tar", remote);

    requests[0].m_Url      = urls[0];
    requests[0].m_Filename = "part1.tar";
    requests[1].m_Url      = urls[1];
    requests[1].m_Filename = "part2.tar";

    config.m_Command      = "sh ./fetch.sh '{input}' '{dir}'";
    config.m_WorkingDir   = test_dir;
    config.m_StartTimeout = 10;
    config.m_JobTimeout   = 0;
  }

  std::string JobListPath(const char* name)
  {
    return std::string(test_dir) + "/.snapfetch-job-" + name + ".txt";
  }
};

TEST_F(DownloaderTest, DownloadsAllParts)
{
  ASSERT_EQ(JobResult::kOk, DownloaderRunJob(&config, &heap, "full", requests, 2));

  EXPECT_EQ("first part", ReadTestFile("part1.tar"));
  EXPECT_EQ("second part", ReadTestFile("part2.tar"));
  EXPECT_FALSE(TestFileExists(JobListPath("full").c_str()));
  EXPECT_EQ(1u, g_Stats.m_DownloadJobCount);
}

TEST_F(DownloaderTest, JobListFormat)
{
  config.m_Command = "cp '{input}' joblist.txt && sh ./fetch.sh '{input}' '{dir}'";

  ASSERT_EQ(JobResult::kOk, DownloaderRunJob(&config, &heap, "full", requests, 2));

  std::string expected = std::string(urls[0]) + "\n  out=part1.tar\n" + urls[1] + "\n  out=part2.tar\n";
  EXPECT_EQ(expected, ReadTestFile("joblist.txt"));
}

TEST_F(DownloaderTest, NothingToFetch)
{
  config.m_Command = "exit 1";
  EXPECT_EQ(JobResult::kOk, DownloaderRunJob(&config, &heap, "full", requests, 0));
  EXPECT_EQ(0u, g_Stats.m_DownloadJobCount);
}

TEST_F(DownloaderTest, VanishedWithoutFiles)
{
  config.m_Command = "true";
  EXPECT_EQ(JobResult::kVanished, DownloaderRunJob(&config, &heap, "full", requests, 2));
  EXPECT_FALSE(TestFileExists(JobListPath("full").c_str()));
}

TEST_F(DownloaderTest, VanishedWithIncompletePart)
{
  config.m_Command = "sh ./fetch.sh '{input}' '{dir}' && echo > part2.tar.aria2";

  EXPECT_EQ(JobResult::kVanished, DownloaderRunJob(&config, &heap, "full", requests, 2));

  // The incomplete part and its control file are torn down; the finished
  // one stays.
  EXPECT_TRUE(TestFileExists("part1.tar"));
  EXPECT_FALSE(TestFileExists("part2.tar"));
  EXPECT_FALSE(TestFileExists("part2.tar.aria2"));
}

TEST_F(DownloaderTest, FailedJobIsTornDown)
{
  config.m_Command = "echo partial > part1.tar; echo > part1.tar.aria2; exit 7";

  EXPECT_EQ(JobResult::kFailed, DownloaderRunJob(&config, &heap, "full", requests, 2));
  EXPECT_FALSE(TestFileExists("part1.tar"));
  EXPECT_FALSE(TestFileExists("part1.tar.aria2"));
  EXPECT_FALSE(TestFileExists(JobListPath("full").c_str()));
}

TEST_F(DownloaderTest, JobTimeout)
{
  config.m_Command    = "sleep 30";
  config.m_JobTimeout = 1;

  EXPECT_EQ(JobResult::kTimeout, DownloaderRunJob(&config, &heap, "full", requests, 2));
  EXPECT_FALSE(TestFileExists(JobListPath("full").c_str()));
}

TEST_F(DownloaderTest, Interrupted)
{
  config.m_Command = "sleep 30";
  SignalSet("test");

  EXPECT_EQ(JobResult::kInterrupted, DownloaderRunJob(&config, &heap, "full", requests, 2));
}

TEST_F(DownloaderTest, QuoteInDirectoryIsSetupError)
{
  ASSERT_EQ(0, mkdir("it's", 0777));

  char dir[kMaxPathLength];
  snprintf(dir, sizeof dir, "%s/it's", test_dir);
  config.m_WorkingDir = dir;

  EXPECT_EQ(JobResult::kSetupError, DownloaderRunJob(&config, &heap, "full", requests, 2));
  EXPECT_FALSE(TestFileExists("it's/.snapfetch-job-full.txt"));
}

TEST_F(DownloaderTest, SeparateJobsUseSeparateLists)
{
  config.m_Command = "cp '{input}' list-copy.txt; sh ./fetch.sh '{input}' '{dir}'";

  ASSERT_EQ(JobResult::kOk, DownloaderRunJob(&config, &heap, "retry-1", &requests[1], 1));
  EXPECT_EQ(std::string(urls[1]) + "\n  out=part2.tar\n", ReadTestFile("list-copy.txt"));
  EXPECT_FALSE(TestFileExists("part1.tar"));
}

TEST_F(DownloaderTest, PartNeedsFetch)
{
  EXPECT_TRUE(DownloaderPartNeedsFetch("part1.tar"));

  WriteTestFile("part1.tar", "x");
  EXPECT_FALSE(DownloaderPartNeedsFetch("part1.tar"));

  WriteTestFile("part1.tar.aria2", "");
  EXPECT_TRUE(DownloaderPartNeedsFetch("part1.tar"));

  ASSERT_EQ(0, mkdir("part2.tar", 0777));
  EXPECT_TRUE(DownloaderPartNeedsFetch("part2.tar"));
}
