#include "TestHarness.hpp"
#include "ManifestSource.hpp"

#include <cstring>
#include <sys/stat.h>

using namespace sf;

class ManifestSourceTest : public TempDirTest
{
protected:
  ManifestSourceConfig config;
  Buffer<char>         text;
  char                 error[1024];
  char                 base_url[kMaxUrlLength];

protected:
  void SetUp() override
  {
    TempDirTest::SetUp();

    snprintf(base_url, sizeof base_url, "file://%s/mirror/", test_dir);

    config.m_BaseUrl      = base_url;
    config.m_Chain        = "arb1";
    config.m_SnapshotType = "pruned";
    config.m_ManifestUrl  = nullptr;
    config.m_PartBaseUrl  = nullptr;
    config.m_FetchCommand = "printf 'fetched %s' '{url}'";
    config.m_FetchTimeout = 10;

    BufferInit(&text);
    error[0] = '\0';
  }

  void TearDown() override
  {
    BufferDestroy(&text, &heap);
    TempDirTest::TearDown();
  }

  std::string Text() const
  {
    return std::string(text.m_Storage ? text.m_Storage : "", text.m_Size);
  }

  void MakeMirror()
  {
    ASSERT_EQ(0, mkdir("mirror", 0777));
    ASSERT_EQ(0, mkdir("mirror/arb1", 0777));
    ASSERT_EQ(0, mkdir("mirror/arb1/2024-06-01", 0777));
  }
};

TEST_F(ManifestSourceTest, ReadsLocalPaths)
{
  WriteTestFile("local.txt", "local contents");

  ASSERT_TRUE(FetchUrlText(&config, "local.txt", &heap, &text, error)) << error;
  EXPECT_EQ("local contents", Text());

  BufferClear(&text);
  std::string url = std::string("file://") + test_dir + "/local.txt";
  ASSERT_TRUE(FetchUrlText(&config, url.c_str(), &heap, &text, error)) << error;
  EXPECT_EQ("local contents", Text());
}

TEST_F(ManifestSourceTest, MissingLocalFile)
{
  EXPECT_FALSE(FetchUrlText(&config, "missing.txt", &heap, &text, error));
  EXPECT_NE(nullptr, strstr(error, "missing.txt"));
}

TEST_F(ManifestSourceTest, RemoteUrlsGoThroughFetchCommand)
{
  ASSERT_TRUE(FetchUrlText(&config, "https://snapshot.example.org/arb1/latest-pruned.txt", &heap, &text, error)) << error;
  EXPECT_EQ("fetched https://snapshot.example.org/arb1/latest-pruned.txt", Text());
}

TEST_F(ManifestSourceTest, FetchCommandFailure)
{
  config.m_FetchCommand = "echo partial; exit 22";
  BufferAppendString(&text, &heap, "kept");

  EXPECT_FALSE(FetchUrlText(&config, "https://snapshot.example.org/x", &heap, &text, error));
  EXPECT_NE(nullptr, strstr(error, "exit code 22"));
  EXPECT_EQ("kept", Text());
}

TEST_F(ManifestSourceTest, PartBaseUrl)
{
  char url[kMaxUrlLength];

  config.m_BaseUrl = "https://snapshot.example.org/";
  ManifestSourcePartBaseUrl(&config, url);
  EXPECT_STREQ("https://snapshot.example.org/arb1", url);

  config.m_ManifestUrl = "https://mirror.example.org/arb1/2024-06-01/pruned.tar.manifest.txt";
  ManifestSourcePartBaseUrl(&config, url);
  EXPECT_STREQ("https://snapshot.example.org/arb1", url);

  config.m_PartBaseUrl = "https://parts.example.org/arb1/";
  ManifestSourcePartBaseUrl(&config, url);
  EXPECT_STREQ("https://parts.example.org/arb1", url);
}

TEST_F(ManifestSourceTest, FollowsLatestPointer)
{
  MakeMirror();
  WriteTestFile("mirror/arb1/latest-pruned.txt", "  arb1/2024-06-01/pruned.tar\n");
  WriteTestFile("mirror/arb1/2024-06-01/pruned.tar.manifest.txt", "manifest body\n");

  ASSERT_TRUE(ManifestSourceFetch(&config, &heap, &text, error)) << error;
  EXPECT_EQ("manifest body\n", Text());
}

TEST_F(ManifestSourceTest, SnapshotTypeSelectsPointer)
{
  MakeMirror();
  config.m_SnapshotType = "archive";
  WriteTestFile("mirror/arb1/latest-pruned.txt", "arb1/2024-06-01/pruned.tar\n");
  WriteTestFile("mirror/arb1/latest-archive.txt", "/arb1/2024-06-01/archive.tar");
  WriteTestFile("mirror/arb1/2024-06-01/archive.tar.manifest.txt", "archive manifest\n");

  ASSERT_TRUE(ManifestSourceFetch(&config, &heap, &text, error)) << error;
  EXPECT_EQ("archive manifest\n", Text());
}

TEST_F(ManifestSourceTest, BadPointer)
{
  MakeMirror();

  WriteTestFile("mirror/arb1/latest-pruned.txt", " \n\n");
  EXPECT_FALSE(ManifestSourceFetch(&config, &heap, &text, error));
  EXPECT_NE(nullptr, strstr(error, "latest-pruned.txt"));

  WriteTestFile("mirror/arb1/latest-pruned.txt", "arb1/a/pruned.tar\narb1/b/pruned.tar\n");
  EXPECT_FALSE(ManifestSourceFetch(&config, &heap, &text, error));
}

TEST_F(ManifestSourceTest, PointerWithNulByte)
{
  MakeMirror();
  WriteTestFile("mirror/arb1/2024-06-01/pruned.tar.manifest.txt", "manifest body\n");

  WriteTestFile("mirror/arb1/latest-pruned.txt", std::string("arb1/2024-06-01/pruned.tar\0\n", 28));
  EXPECT_FALSE(ManifestSourceFetch(&config, &heap, &text, error));
  EXPECT_NE(nullptr, strstr(error, "doesn't name a snapshot"));

  WriteTestFile("mirror/arb1/latest-pruned.txt", std::string("\0arb1/2024-06-01/pruned.tar", 27));
  EXPECT_FALSE(ManifestSourceFetch(&config, &heap, &text, error));
}

TEST_F(ManifestSourceTest, MissingPointer)
{
  EXPECT_FALSE(ManifestSourceFetch(&config, &heap, &text, error));
  EXPECT_NE(nullptr, strstr(error, "latest-pruned.txt"));
}

TEST_F(ManifestSourceTest, ExplicitManifestUrl)
{
  WriteTestFile("my.manifest.txt", "explicit\n");
  config.m_ManifestUrl = "my.manifest.txt";

  ASSERT_TRUE(ManifestSourceFetch(&config, &heap, &text, error)) << error;
  EXPECT_EQ("explicit\n", Text());
}

TEST_F(ManifestSourceTest, ExplicitManifestUrlKeepsChainPartBase)
{
  char url[kMaxUrlLength];

  // Manifest entries look like "2024-06-01/pruned.tar.part0", so parts
  // resolve against the chain directory rather than the manifest's.
  config.m_BaseUrl     = "https://snapshot.example.org";
  config.m_Chain       = "nova";
  config.m_ManifestUrl = "https://snapshot.example.org/nova/2024-06-01/pruned.tar.manifest.txt";
  ManifestSourcePartBaseUrl(&config, url);
  EXPECT_STREQ("https://snapshot.example.org/nova", url);

  config.m_ManifestUrl = "local.manifest.txt";
  ManifestSourcePartBaseUrl(&config, url);
  EXPECT_STREQ("https://snapshot.example.org/nova", url);
}
