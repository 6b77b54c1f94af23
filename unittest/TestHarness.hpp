#ifndef SNAPFETCH_TESTHARNESS_HPP
#define SNAPFETCH_TESTHARNESS_HPP

#include "Common.hpp"
#include "Hash.hpp"
#include "MemAllocHeap.hpp"

#include <gtest/gtest.h>

#include <string>
#include <time.h>

namespace sf
{

// Runs each test inside a fresh temporary directory, removed afterwards.
class TempDirTest : public ::testing::Test
{
protected:
  MemAllocHeap heap;
  char         test_dir[kMaxPathLength];

protected:
  void SetUp() override;
  void TearDown() override;

private:
  char         m_OldCwd[kMaxPathLength];
  int          m_OldLogFlags;
};

void WriteTestFile(const char* path, const std::string& contents);

std::string ReadTestFile(const char* path);

// SHA-256 of `contents`, as a digest and as lowercase hex.
void Sha256Digest(HashDigest* digest_out, const std::string& contents);
std::string Sha256Hex(const std::string& contents);

void SetFileTime(const char* path, time_t mtime);

bool TestFileExists(const char* path);

// Writes a shell script standing in for aria2c: `sh <path> <input> <dir>`
// copies each URL of the input list (a local path or file:// URL) to its
// out= name in dir.
// While <dir>/bad_runs holds a positive count, a run writes garbage instead
// and decrements it. Every run appends a line to <dir>/runs.
void WriteFakeDownloader(const char* path);

}

#endif
