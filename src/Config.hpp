#ifndef SNAPFETCH_CONFIG_HPP
#define SNAPFETCH_CONFIG_HPP

// Preprocessor helpers to check for definedness giving compile errors if used
// against features with missing #defines.
#define YES      -1
#define NO       -2
#define ENABLED(feature)  (1 == 2 feature)
#define DISABLED(feature)  (0 == 2 feature)

#if defined(_DEBUG)
#define CHECKED_BUILD YES
#else
#define CHECKED_BUILD NO
#endif

// Compiler macros.
#if defined(__GNUC__)
#define RESTRICT __restrict
#define NORETURN __attribute__((noreturn))
#define PRINTF_LIKE(fmt_index, arg_index) __attribute__((format(printf, fmt_index, arg_index)))
#define ALIGNOF(t) __alignof(t)
#define ALIGN(n) __attribute__((aligned(n)))
#else
#error unsupported compiler
#endif

// Platform macros. The downloader drives child processes through fork/exec,
// so only unix-like hosts are supported.
#if defined(__APPLE__)
#define SNAPFETCH_UNIX 1
#define SNAPFETCH_APPLE 1
#define SNAPFETCH_CASE_INSENSITIVE_FILESYSTEM YES
#elif defined(__linux__)
#define SNAPFETCH_UNIX 1
#define SNAPFETCH_LINUX 1
#define SNAPFETCH_CASE_INSENSITIVE_FILESYSTEM NO
#elif defined(__FreeBSD__)
#define SNAPFETCH_UNIX 1
#define SNAPFETCH_FREEBSD 1
#define SNAPFETCH_CASE_INSENSITIVE_FILESYSTEM NO
#elif defined(__OpenBSD__)
#define SNAPFETCH_UNIX 1
#define SNAPFETCH_OPENBSD 1
#define SNAPFETCH_CASE_INSENSITIVE_FILESYSTEM NO
#else
#error Unsupported OS
#endif

#if defined(SNAPFETCH_APPLE)
#define SNAPFETCH_PLATFORM_STRING "macosx"
#elif defined(SNAPFETCH_LINUX)
#define SNAPFETCH_PLATFORM_STRING "linux"
#elif defined(SNAPFETCH_FREEBSD)
#define SNAPFETCH_PLATFORM_STRING "freebsd"
#elif defined(SNAPFETCH_OPENBSD)
#define SNAPFETCH_PLATFORM_STRING "openbsd"
#endif

#define SF_PATHSEP     '/'
#define SF_PATHSEP_STR "/"

#define SNAPFETCH_VERSION_STRING "1.0.0"

#endif
