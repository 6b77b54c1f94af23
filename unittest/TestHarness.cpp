#include "TestHarness.hpp"
#include "FileInfo.hpp"
#include "Hash.hpp"
#include "SignalHandler.hpp"
#include "Stats.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <ftw.h>
#include <unistd.h>
#include <utime.h>

namespace sf
{

static int RemoveEntry(const char* path, const struct stat*, int, struct FTW*)
{
  return remove(path);
}

void TempDirTest::SetUp()
{
  HeapInit(&heap);
  StatsReset();
  SignalReset();

  m_OldLogFlags = GetLogFlags();
  SetLogFlags(kError);

  GetCwd(m_OldCwd, sizeof m_OldCwd);

  snprintf(test_dir, sizeof test_dir, "/tmp/snapfetch-test-XXXXXX");
  ASSERT_NE(nullptr, mkdtemp(test_dir));
  ASSERT_TRUE(SetCwd(test_dir));
}

void TempDirTest::TearDown()
{
  EXPECT_TRUE(SetCwd(m_OldCwd));
  nftw(test_dir, RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);

  SignalReset();
  SetLogFlags(m_OldLogFlags);
  HeapDestroy(&heap);
}

void WriteTestFile(const char* path, const std::string& contents)
{
  FILE* f = fopen(path, "wb");
  ASSERT_NE(nullptr, f) << path;
  ASSERT_EQ(contents.size(), fwrite(contents.data(), 1, contents.size(), f));
  fclose(f);
}

std::string ReadTestFile(const char* path)
{
  std::string result;

  FILE* f = fopen(path, "rb");
  if (!f)
    return result;

  char buffer[4096];
  while (size_t n = fread(buffer, 1, sizeof buffer, f))
    result.append(buffer, n);

  fclose(f);
  return result;
}

void Sha256Digest(HashDigest* digest_out, const std::string& contents)
{
  HashState h;
  HashInit(&h);
  HashUpdate(&h, contents.data(), contents.size());
  HashFinalize(&h, digest_out);
}

std::string Sha256Hex(const std::string& contents)
{
  HashDigest digest;
  Sha256Digest(&digest, contents);

  char str[kDigestStringSize];
  DigestToString(str, digest);
  return str;
}

void SetFileTime(const char* path, time_t mtime)
{
  struct utimbuf times;
  times.actime  = mtime;
  times.modtime = mtime;
  ASSERT_EQ(0, utime(path, &times)) << path;
}

bool TestFileExists(const char* path)
{
  return GetFileInfo(path).Exists();
}

void WriteFakeDownloader(const char* path)
{
  WriteTestFile(path,
    "list=$1\n"
    "dir=$2\n"
    "bad=0\n"
    "if [ -f \"$dir/bad_runs\" ]; then bad=$(cat \"$dir/bad_runs\"); fi\n"
    "if [ \"$bad\" -gt 0 ]; then echo $((bad - 1)) > \"$dir/bad_runs\"; fi\n"
    "echo run >> \"$dir/runs\"\n"
    "url=\n"
    "while IFS= read -r line; do\n"
    "  case \"$line\" in\n"
    "    \"  out=\"*)\n"
    "      name=${line#  out=}\n"
    "      if [ \"$bad\" -gt 0 ]; then\n"
    "        echo garbage > \"$dir/$name\"\n"
    "      else\n"
    "        cp \"$url\" \"$dir/$name\" || exit 1\n"
    "      fi\n"
    "      ;;\n"
    "    *) url=${line#file://} ;;\n"
    "  esac\n"
    "done < \"$list\"\n");
}

}
