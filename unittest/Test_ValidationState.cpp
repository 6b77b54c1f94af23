#include "TestHarness.hpp"
#include "ValidationState.hpp"
#include "Verifier.hpp"

#include <cstring>

using namespace sf;

class ValidationStateTest : public TempDirTest
{
protected:
  ValidationState state;

protected:
  void SetUp() override
  {
    TempDirTest::SetUp();
    ValidationStateInit(&state, ".");
  }

  static VerifyOutcome Outcome(VerifyStatus::Enum status, const char* filename, const char* expected)
  {
    VerifyOutcome outcome;
    memset(&outcome, 0, sizeof outcome);
    outcome.m_Status           = status;
    outcome.m_Filename         = filename;
    outcome.m_ExpectedChecksum = expected;
    return outcome;
  }
};

TEST_F(ValidationStateTest, Paths)
{
  EXPECT_STREQ(".checksum_cache.json", state.m_CachePath);
  EXPECT_STREQ(".checksum_failures.txt", state.m_LedgerPath);
  EXPECT_STREQ(".checksums_validated", state.m_MarkerPath);
  EXPECT_STREQ(".snapshot_manifest.txt", state.m_ManifestCopyPath);

  ValidationState other;
  ValidationStateInit(&other, "/data/arb1");
  EXPECT_STREQ("/data/arb1/.checksum_failures.txt", other.m_LedgerPath);
}

TEST_F(ValidationStateTest, Marker)
{
  EXPECT_FALSE(ValidationMarkerExists(&state));

  VerifyOutcome outcome = Outcome(VerifyStatus::kSuccess, "part1.tar", "ab");
  strcpy(outcome.m_ActualChecksum, "ab");
  ASSERT_TRUE(ValidationMarkerWrite(&state, &outcome, 1, &heap));
  EXPECT_TRUE(ValidationMarkerExists(&state));
  EXPECT_NE(std::string::npos, ReadTestFile(".checksums_validated").find("part1.tar"));

  ASSERT_TRUE(ValidationMarkerRemove(&state));
  EXPECT_FALSE(ValidationMarkerExists(&state));

  // Removing it again is fine.
  EXPECT_TRUE(ValidationMarkerRemove(&state));
}

TEST_F(ValidationStateTest, LedgerListsOnlyFailures)
{
  VerifyOutcome outcomes[] =
  {
    Outcome(VerifyStatus::kSuccess,  "part0.tar", "aaaa"),
    Outcome(VerifyStatus::kMismatch, "part1.tar", "bbbb"),
    Outcome(VerifyStatus::kIoError,  "part2.tar", "cccc"),
  };

  ASSERT_TRUE(FailureLedgerWrite(&state, outcomes, 3, &heap));
  EXPECT_EQ("part1.tar|bbbb\npart2.tar|cccc\n", ReadTestFile(".checksum_failures.txt"));

  FailureLedger ledger;
  FailureLedgerInit(&ledger, &heap);
  ASSERT_TRUE(FailureLedgerLoad(&ledger, &state));
  ASSERT_EQ(2u, ledger.m_Entries.m_Size);
  EXPECT_STREQ("part1.tar", ledger.m_Entries[0].m_Filename);
  EXPECT_STREQ("bbbb", ledger.m_Entries[0].m_ExpectedChecksum);
  EXPECT_STREQ("part2.tar", ledger.m_Entries[1].m_Filename);
  EXPECT_STREQ("cccc", ledger.m_Entries[1].m_ExpectedChecksum);
  FailureLedgerDestroy(&ledger);
}

TEST_F(ValidationStateTest, MissingLedgerLoadsEmpty)
{
  FailureLedger ledger;
  FailureLedgerInit(&ledger, &heap);
  ASSERT_TRUE(FailureLedgerLoad(&ledger, &state));
  EXPECT_EQ(0u, ledger.m_Entries.m_Size);
  FailureLedgerDestroy(&ledger);

  EXPECT_TRUE(FailureLedgerRemove(&state));
}

TEST_F(ValidationStateTest, LedgerSkipsMalformedLines)
{
  WriteTestFile(".checksum_failures.txt", "part1.tar|bbbb\r\n\nno separator\n|cccc\npart3.tar|\npart4.tar|dddd");

  FailureLedger ledger;
  FailureLedgerInit(&ledger, &heap);
  ASSERT_TRUE(FailureLedgerLoad(&ledger, &state));
  ASSERT_EQ(2u, ledger.m_Entries.m_Size);
  EXPECT_STREQ("part1.tar", ledger.m_Entries[0].m_Filename);
  EXPECT_STREQ("bbbb", ledger.m_Entries[0].m_ExpectedChecksum);
  EXPECT_STREQ("part4.tar", ledger.m_Entries[1].m_Filename);
  EXPECT_STREQ("dddd", ledger.m_Entries[1].m_ExpectedChecksum);
  FailureLedgerDestroy(&ledger);
}

TEST_F(ValidationStateTest, StoredManifest)
{
  const char text[] = "line one\nline two\n";

  EXPECT_FALSE(StoredManifestMatches(&state, text, strlen(text), &heap));

  ASSERT_TRUE(StoredManifestStore(&state, text, strlen(text)));
  EXPECT_TRUE(StoredManifestMatches(&state, text, strlen(text), &heap));
  EXPECT_FALSE(StoredManifestMatches(&state, text, strlen(text) - 1, &heap));
  EXPECT_FALSE(StoredManifestMatches(&state, "line one\nline twO\n", strlen(text), &heap));

  Buffer<char> loaded;
  BufferInit(&loaded);
  ASSERT_TRUE(StoredManifestLoad(&state, &heap, &loaded));
  ASSERT_EQ(strlen(text), loaded.m_Size);
  EXPECT_EQ(0, memcmp(text, loaded.m_Storage, loaded.m_Size));
  BufferDestroy(&loaded, &heap);
}
