#include "Common.hpp"
#include "TestHarness.hpp"

#include <cstring>

using namespace sf;

TEST(Djb2, Vanilla)
{
  ASSERT_EQ(3007235198u, Djb2Hash("FooBar"));
}

TEST(Djb2, NoCase)
{
  ASSERT_EQ(Djb2Hash("foobar"), Djb2HashNoCase("FooBar"));
  ASSERT_EQ(Djb2Hash("foobar"), Djb2HashNoCase("foobar"));
}

TEST(CopyString, Truncates)
{
  char buf[8];
  EXPECT_TRUE(CopyString(buf, sizeof buf, "short"));
  EXPECT_STREQ("short", buf);

  EXPECT_FALSE(CopyString(buf, sizeof buf, "much too long"));
  EXPECT_STREQ("much to", buf);
}

class CommonFileTest : public TempDirTest
{
};

TEST_F(CommonFileTest, WriteFileAtomicReplacesContents)
{
  WriteTestFile("state.txt", "old contents");

  ASSERT_TRUE(WriteFileAtomic("state.txt", "new", 3));
  EXPECT_EQ("new", ReadTestFile("state.txt"));
  EXPECT_FALSE(TestFileExists("state.txt.tmp"));
}

TEST_F(CommonFileTest, WriteFileAtomicFailsForMissingDirectory)
{
  ASSERT_FALSE(WriteFileAtomic("no-such-dir/state.txt", "x", 1));
}

TEST_F(CommonFileTest, RemoveFileToleratesMissingFiles)
{
  WriteTestFile("doomed", "x");
  EXPECT_TRUE(RemoveFile("doomed"));
  EXPECT_FALSE(TestFileExists("doomed"));
  EXPECT_TRUE(RemoveFile("doomed"));
}
