#include "TestHarness.hpp"
#include "ChecksumCache.hpp"
#include "Stats.hpp"

using namespace sf;

class ChecksumCacheTest : public TempDirTest
{
protected:
  HashDigest digest_a;
  HashDigest digest_b;

protected:
  void SetUp() override
  {
    TempDirTest::SetUp();
    Sha256Digest(&digest_a, "a");
    Sha256Digest(&digest_b, "b");
  }

  static FileInfo Fingerprint(uint64_t mtime, uint64_t size)
  {
    FileInfo info;
    info.m_Flags     = FileInfo::kFlagExists | FileInfo::kFlagFile;
    info.m_Errno     = 0;
    info.m_Timestamp = mtime;
    info.m_Size      = size;
    return info;
  }
};

TEST_F(ChecksumCacheTest, MissingDocumentStartsEmpty)
{
  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");

  EXPECT_EQ(0, ChecksumCacheCount(&cache));

  HashDigest d;
  EXPECT_FALSE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(1, 2), &d));
  EXPECT_EQ(1u, g_Stats.m_DigestCacheMisses);

  // Nothing changed, nothing written.
  EXPECT_TRUE(ChecksumCacheSave(&cache));
  EXPECT_FALSE(TestFileExists(".checksum_cache.json"));

  ChecksumCacheDestroy(&cache);
}

TEST_F(ChecksumCacheTest, HitRequiresSameFingerprint)
{
  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");

  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(1700000000, 100), digest_a);

  HashDigest d;
  ASSERT_TRUE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(1700000000, 100), &d));
  EXPECT_EQ(digest_a, d);

  EXPECT_FALSE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(1700000001, 100), &d));
  EXPECT_FALSE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(1700000000, 101), &d));
  EXPECT_FALSE(ChecksumCacheGet(&cache, "part2.tar", Fingerprint(1700000000, 100), &d));

  EXPECT_EQ(1u, g_Stats.m_DigestCacheHits);
  EXPECT_EQ(3u, g_Stats.m_DigestCacheMisses);

  ChecksumCacheDestroy(&cache);
}

TEST_F(ChecksumCacheTest, SetReplacesRecord)
{
  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");

  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(1, 1), digest_a);
  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(2, 2), digest_b);

  EXPECT_EQ(1, ChecksumCacheCount(&cache));

  HashDigest d;
  EXPECT_FALSE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(1, 1), &d));
  ASSERT_TRUE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(2, 2), &d));
  EXPECT_EQ(digest_b, d);

  ChecksumCacheDestroy(&cache);
}

TEST_F(ChecksumCacheTest, SaveWritesDocumentFormat)
{
  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");
  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(1700000000, 1048576), digest_a);
  ASSERT_TRUE(ChecksumCacheSave(&cache));
  ChecksumCacheDestroy(&cache);

  char hex[kDigestStringSize];
  DigestToString(hex, digest_a);

  std::string text = ReadTestFile(".checksum_cache.json");
  EXPECT_NE(std::string::npos, text.find("\"part1.tar\""));
  EXPECT_NE(std::string::npos, text.find(std::string("\"checksum\": \"") + hex + "\""));
  EXPECT_NE(std::string::npos, text.find("\"metadata\": \"1700000000:1048576\""));
}

TEST_F(ChecksumCacheTest, ReloadsSavedRecords)
{
  {
    ChecksumCache cache;
    ChecksumCacheInit(&cache, ".checksum_cache.json");
    ChecksumCacheSet(&cache, "part1.tar", Fingerprint(10, 20), digest_a);
    ChecksumCacheSet(&cache, "part2.tar", Fingerprint(30, 40), digest_b);
    ASSERT_TRUE(ChecksumCacheSave(&cache));
    ChecksumCacheDestroy(&cache);
  }

  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");
  EXPECT_EQ(2, ChecksumCacheCount(&cache));

  HashDigest d;
  ASSERT_TRUE(ChecksumCacheGet(&cache, "part2.tar", Fingerprint(30, 40), &d));
  EXPECT_EQ(digest_b, d);
  ASSERT_TRUE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(10, 20), &d));
  EXPECT_EQ(digest_a, d);

  ChecksumCacheDestroy(&cache);
}

TEST_F(ChecksumCacheTest, ReadsDocumentWrittenByHand)
{
  std::string hex = Sha256Hex("a");
  WriteTestFile(".checksum_cache.json",
      "{\n  \"part1.tar\": { \"checksum\": \"" + hex + "\", \"metadata\": \"5:6\" }\n}\n");

  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");

  HashDigest d;
  ASSERT_TRUE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(5, 6), &d));
  EXPECT_EQ(digest_a, d);

  ChecksumCacheDestroy(&cache);
}

TEST_F(ChecksumCacheTest, CorruptDocumentIsIgnored)
{
  WriteTestFile(".checksum_cache.json", "{ \"part1.tar\": { \"checksum\": ");

  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");
  EXPECT_EQ(0, ChecksumCacheCount(&cache));

  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(1, 1), digest_a);
  ASSERT_TRUE(ChecksumCacheSave(&cache));
  ChecksumCacheDestroy(&cache);

  ChecksumCacheInit(&cache, ".checksum_cache.json");
  EXPECT_EQ(1, ChecksumCacheCount(&cache));
  ChecksumCacheDestroy(&cache);
}

TEST_F(ChecksumCacheTest, MalformedRecordsAreDropped)
{
  std::string hex = Sha256Hex("a");
  WriteTestFile(".checksum_cache.json",
      "{ \"good.tar\": { \"checksum\": \"" + hex + "\", \"metadata\": \"5:6\" },"
      "  \"badsum.tar\": { \"checksum\": \"xyz\", \"metadata\": \"5:6\" },"
      "  \"badmeta.tar\": { \"checksum\": \"" + hex + "\", \"metadata\": \"5\" },"
      "  \"nometa.tar\": { \"checksum\": \"" + hex + "\" } }");

  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");
  EXPECT_EQ(1, ChecksumCacheCount(&cache));

  // The document gets rewritten without the bad records.
  ASSERT_TRUE(ChecksumCacheSave(&cache));
  ChecksumCacheDestroy(&cache);

  std::string text = ReadTestFile(".checksum_cache.json");
  EXPECT_NE(std::string::npos, text.find("good.tar"));
  EXPECT_EQ(std::string::npos, text.find("badsum.tar"));
  EXPECT_EQ(std::string::npos, text.find("badmeta.tar"));
  EXPECT_EQ(std::string::npos, text.find("nometa.tar"));
}

TEST_F(ChecksumCacheTest, InvalidatedRecordNeverMatches)
{
  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");
  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(10, 20), digest_a);
  ChecksumCacheSet(&cache, "part2.tar", Fingerprint(30, 40), digest_b);
  ASSERT_TRUE(ChecksumCacheSave(&cache));

  ChecksumCacheInvalidate(&cache, "part1.tar");
  ChecksumCacheInvalidate(&cache, "part3.tar");

  HashDigest d;
  EXPECT_FALSE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(10, 20), &d));
  EXPECT_EQ(1, ChecksumCacheCount(&cache));

  ASSERT_TRUE(ChecksumCacheSave(&cache));
  ChecksumCacheDestroy(&cache);

  std::string text = ReadTestFile(".checksum_cache.json");
  EXPECT_EQ(std::string::npos, text.find("part1.tar"));
  EXPECT_NE(std::string::npos, text.find("part2.tar"));

  // A later digest brings the record back.
  ChecksumCacheInit(&cache, ".checksum_cache.json");
  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(11, 20), digest_a);
  EXPECT_TRUE(ChecksumCacheGet(&cache, "part1.tar", Fingerprint(11, 20), &d));
  ChecksumCacheDestroy(&cache);
}

TEST_F(ChecksumCacheTest, OversizedDocumentIsIgnored)
{
  // Valid JSON whose parsed form needs far more memory than its text.
  std::string wide = "[";
  for (int i = 0; i < 50000; ++i)
    wide += "0,";
  wide += "0]";
  WriteTestFile(".checksum_cache.json", wide);

  ChecksumCache cache;
  ChecksumCacheInit(&cache, ".checksum_cache.json");
  EXPECT_EQ(0, ChecksumCacheCount(&cache));

  ChecksumCacheSet(&cache, "part1.tar", Fingerprint(1, 1), digest_a);
  ASSERT_TRUE(ChecksumCacheSave(&cache));
  ChecksumCacheDestroy(&cache);

  ChecksumCacheInit(&cache, ".checksum_cache.json");
  EXPECT_EQ(1, ChecksumCacheCount(&cache));
  ChecksumCacheDestroy(&cache);
}
