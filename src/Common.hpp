#ifndef SNAPFETCH_COMMON_HPP
#define SNAPFETCH_COMMON_HPP

#include "Config.hpp"

#include <cstddef>
#include <stdint.h>

#define MB(n) ((n) * 1024 * 1024)
#define KB(n) ((n) * 1024)

#define ARRAY_SIZE(a) (sizeof((a)) / sizeof((a)[0]))

#if ENABLED(CHECKED_BUILD)
#define CHECK(expr) \
do { if (!(expr)) ::sf::CroakAbort("%s(%d): check failure %s", __FILE__, __LINE__, #expr); } while(0)
#else
#define CHECK(expr) do {} while(0)
#endif

#define SF_ALIGN(v, alignment) (((v) + (alignment) - 1) & ~((alignment) - 1))

namespace sf
{

static const int kMaxPathLength = 1024;
static const int kMaxUrlLength  = 2048;

void InitCommon(void);

//-----------------------------------------------------------------------------
// Error handling
//-----------------------------------------------------------------------------

// Terminate the program with an error message on stderr
void NORETURN Croak(const char* fmt, ...) PRINTF_LIKE(1, 2);

// Terminate the program with an error message on stderr, also printing the errno status
void NORETURN CroakErrno(const char* fmt, ...) PRINTF_LIKE(1, 2);

// Abort the program with an error message on stderr
void NORETURN CroakAbort(const char* fmt, ...) PRINTF_LIKE(1, 2);

//-----------------------------------------------------------------------------
// Logging
//-----------------------------------------------------------------------------

enum LogLevel
{
  kError        = 1 << 0,
  kWarning      = 1 << 1,
  kInfo         = 1 << 2,
  kDebug        = 1 << 3,
  kSpam         = 1 << 4
};

int GetLogFlags();

void SetLogFlags(int log_level);

// Each call emits exactly one timestamped line, so it's safe to log from
// verification threads.
void Log(LogLevel level, const char* fmt, ...) PRINTF_LIKE(2, 3);

//-----------------------------------------------------------------------------
// String hashing
//-----------------------------------------------------------------------------

inline int FoldCase(int c)
{
  unsigned int x = (unsigned int) c - 'A';
  int d = c + 0x20;
  return (x < 26 ? d : c);
}

// Compute 32-bit DJB-2 hash of a string.
uint32_t Djb2Hash(const char *str);

// Compute 32-bit DJB-2 hash of a string, treating ASCII A-Z as a-z.
uint32_t Djb2HashNoCase(const char *str);

// Compute 32-bit DJB-2 hash of a path string (ignoring case if appropriate).
#if ENABLED(SNAPFETCH_CASE_INSENSITIVE_FILESYSTEM)
inline uint32_t Djb2HashPath(const char *str) { return Djb2HashNoCase(str); }
#else
inline uint32_t Djb2HashPath(const char *str) { return Djb2Hash(str); }
#endif

//-----------------------------------------------------------------------------
// Files and directories
//-----------------------------------------------------------------------------

void GetCwd(char* buffer, size_t buffer_size);
bool SetCwd(const char* dir);

// Remove a file. A file that doesn't exist counts as removed.
bool RemoveFile(const char* path);

bool RenameFile(const char* oldf, const char* newf);

// Write `size` bytes to `path` through a temporary file and a rename, so
// readers never observe a half-written file.
bool WriteFileAtomic(const char* path, const void* data, size_t size);

//-----------------------------------------------------------------------------
// Misc
//-----------------------------------------------------------------------------

uint64_t TimerGet();
double TimerToSeconds(uint64_t start);
double TimerDiffSeconds(uint64_t start, uint64_t end);

int GetCpuCount();

// Copy at most dest_size-1 bytes, always null terminating. Returns false if the
// source was truncated.
bool CopyString(char* dest, size_t dest_size, const char* src);

}

#endif
