#include "CommandLine.hpp"
#include "Engine.hpp"
#include "HashTable.hpp"
#include "MemAllocHeap.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace sf
{

namespace OptionType
{
  enum Enum
  {
    kBool,
    kInt,
    kString
  };
}

static const struct OptionTemplate
{
  char              m_ShortName;
  const char       *m_LongName;
  OptionType::Enum  m_Type;
  size_t            m_Offset;
  const char       *m_Help;
} g_OptionTemplates[] = {
  { 'C', "working-dir", OptionType::kString, offsetof(EngineOptions, m_WorkingDir),
    "Directory holding the snapshot parts (default: current directory)" },
  { 'f', "config", OptionType::kString, offsetof(EngineOptions, m_ConfigFile),
    "Lua configuration file (default: snapfetch.lua if present)" },
  { 'j', "threads", OptionType::kInt, offsetof(EngineOptions, m_ThreadCount),
    "Number of verification threads (0 = CPU count)" },
  { 'a', "attempts", OptionType::kInt, offsetof(EngineOptions, m_MaxAttempts),
    "Maximum number of recovery attempts" },
  { 'v', "verbose", OptionType::kBool, offsetof(EngineOptions, m_Verbose),
    "Enable verbose messages" },
  { 'D', "debug", OptionType::kBool, offsetof(EngineOptions, m_DebugMessages),
    "Enable debug messages" },
  { 'q', "quiet", OptionType::kBool, offsetof(EngineOptions, m_Quiet),
    "Only report errors" },
  { 's', "stats", OptionType::kBool, offsetof(EngineOptions, m_DisplayStats),
    "Display stats" },
  { 'h', "help", OptionType::kBool, offsetof(EngineOptions, m_ShowHelp),
    "Show help" },
};

static int AssignOptionValue(char* option_base, const OptionTemplate* templ, const char* value, bool is_short)
{
  char* dest = option_base + templ->m_Offset;

  switch (templ->m_Type)
  {
    case OptionType::kBool:
      *(bool*)dest = true;
      return 1;

    case OptionType::kInt:
    case OptionType::kString:
      if (!value)
      {
        if (is_short)
          fprintf(stderr, "option requires an argument: %c\n", templ->m_ShortName);
        else
          fprintf(stderr, "option requires an argument: --%s\n", templ->m_LongName);
        return 0;
      }

      if (OptionType::kInt == templ->m_Type)
      {
        char* end;
        long v = strtol(value, &end, 10);
        if (end == value || *end || v < 0 || v > 100000)
        {
          fprintf(stderr, "bad integer for --%s: %s\n", templ->m_LongName, value);
          return 0;
        }
        *(int*)dest = int(v);
      }
      else
      {
        *(const char**)dest = value;
      }
      return is_short ? 2 : 1;

    default:
      return 0;
  }
}

bool CommandLineParseOptions(EngineOptions* options, int* argc, char*** argv)
{
  int opt = 1;
  char* option_base = (char*) options;

  while (opt < *argc)
  {
    bool        found         = false;
    const char *opt_str       = (*argv)[opt];
    int         advance_count = 0;

    if ('-' != opt_str[0])
      break;

    if (opt_str[1] != '-')
    {
      const char* opt_arg = opt + 1 < *argc ? (*argv)[opt + 1] : nullptr;

      if (opt_str[2])
      {
        fprintf(stderr, "bad option: %s\n", opt_str);
        return false;
      }

      for (size_t i = 0; !found && i < ARRAY_SIZE(g_OptionTemplates); ++i)
      {
        const OptionTemplate* templ = g_OptionTemplates + i;

        if (opt_str[1] == templ->m_ShortName)
        {
          found = true;
          advance_count = AssignOptionValue(option_base, templ, opt_arg, true);
        }
      }
    }
    else
    {
      const char *equals  = strchr(opt_str, '=');
      size_t      optlen  = equals ? equals - opt_str - 2 : strlen(opt_str + 2);
      const char *opt_arg = equals ? equals + 1 : nullptr;

      for (size_t i = 0; !found && i < ARRAY_SIZE(g_OptionTemplates); ++i)
      {
        const OptionTemplate* templ = g_OptionTemplates + i;

        if (strlen(templ->m_LongName) == optlen && 0 == memcmp(opt_str + 2, templ->m_LongName, optlen))
        {
          found = true;
          advance_count = AssignOptionValue(option_base, templ, opt_arg, false);
        }
      }
    }

    if (!found)
    {
      fprintf(stderr, "unrecognized option: %s\n", opt_str);
      return false;
    }

    if (0 == advance_count)
      return false;

    opt += advance_count;
  }

  *argc -= opt;
  *argv += opt;

  return true;
}

void CommandLineShowHelp()
{
  printf("\nsnapfetch %s - snapshot download and verification\n\n", SNAPFETCH_VERSION_STRING);

  printf("Usage: snapfetch [options...] <command> [args...]\n\n");
  printf("Commands:\n");
  printf("  sync                                  Fetch the manifest, download, verify and repair\n");
  printf("  recover                               Repair the files listed in the failure ledger\n");
  printf("  verify <count> <sha256,...> <file,...>  Verify files against checksums\n\n");
  printf("Options:\n");

  size_t max_opt_len = 0;
  for (size_t i = 0; i < ARRAY_SIZE(g_OptionTemplates); ++i)
  {
    size_t opt_len = strlen(g_OptionTemplates[i].m_LongName) + 12;
    if (opt_len > max_opt_len)
      max_opt_len = opt_len;
  }

  for (size_t i = 0; i < ARRAY_SIZE(g_OptionTemplates); ++i)
  {
    const OptionTemplate* t = g_OptionTemplates + i;

    char long_text[256];
    if (t->m_Type == OptionType::kInt)
      snprintf(long_text, sizeof long_text, "%s=<integer>", t->m_LongName);
    else if (t->m_Type == OptionType::kString)
      snprintf(long_text, sizeof long_text, "%s=<string>", t->m_LongName);
    else
      snprintf(long_text, sizeof long_text, "%s          ", t->m_LongName);

    printf("  -%c, --%-*s %s\n", t->m_ShortName, (int) max_opt_len, long_text, t->m_Help);
  }

  printf("\nExit codes: 0 all files valid, 1 usage or setup error, 2 checksum failures,\n"
         "3 checksum validation exhausted, 4 interrupted\n");
}

int CommandLineLogFlags(const EngineOptions* options)
{
  int log_flags = kError | kWarning | kInfo;

  if (options->m_Verbose)
    log_flags |= kDebug;

  if (options->m_DebugMessages)
    log_flags |= kDebug | kSpam;

  if (options->m_Quiet)
    log_flags = kError;

  return log_flags;
}

// Split a comma separated list in place.
static void SplitList(char* str, Buffer<char*>* out, MemAllocHeap* heap)
{
  for (;;)
  {
    BufferAppendOne(out, heap, str);

    char* comma = strchr(str, ',');
    if (!comma)
      break;

    *comma = '\0';
    str = comma + 1;
  }
}

static bool CheckVerifyEntries(const Buffer<char*>& checksums, const Buffer<char*>& filenames, MemAllocHeap* heap)
{
  HashTable<int32_t, kFlagPathStrings> seen;
  HashTableInit(&seen, heap);

  bool ok = true;

  for (size_t i = 0; ok && i < filenames.m_Size; ++i)
  {
    const char* filename = filenames[i];

    HashDigest digest;
    if (!DigestFromString(&digest, checksums[i]))
    {
      fprintf(stderr, "verify: not a SHA-256 checksum: \"%s\"\n", checksums[i]);
      ok = false;
    }
    else if (!filename[0])
    {
      fprintf(stderr, "verify: empty filename at position %d\n", int(i + 1));
      ok = false;
    }
    else
    {
      uint32_t hash = Djb2HashPath(filename);

      if (const int32_t* first = HashTableLookup(&seen, hash, filename))
      {
        fprintf(stderr, "verify: duplicate filename \"%s\" at positions %d and %d\n", filename, int(*first + 1), int(i + 1));
        ok = false;
      }
      else
      {
        HashTableInsert(&seen, hash, filename, int32_t(i));
      }
    }
  }

  HashTableDestroy(&seen);
  return ok;
}

bool CommandLineParseVerifyArgs(
    int                     argc,
    char**                  argv,
    MemAllocHeap*           heap,
    Buffer<char*>*          checksums,
    Buffer<char*>*          filenames,
    Buffer<VerifyRequest>*  requests)
{
  if (3 != argc)
  {
    fprintf(stderr, "verify: expected <count> <checksums> <filenames>\n");
    return false;
  }

  char* end;
  long count = strtol(argv[0], &end, 10);
  if (end == argv[0] || *end || count < 1)
  {
    fprintf(stderr, "verify: bad file count: %s\n", argv[0]);
    return false;
  }

  SplitList(argv[1], checksums, heap);
  SplitList(argv[2], filenames, heap);

  if (size_t(count) != checksums->m_Size || size_t(count) != filenames->m_Size)
  {
    fprintf(stderr, "verify: count is %ld but got %d checksums and %d filenames\n",
        count, int(checksums->m_Size), int(filenames->m_Size));
    return false;
  }

  if (!CheckVerifyEntries(*checksums, *filenames, heap))
    return false;

  for (long i = 0; i < count; ++i)
  {
    VerifyRequest request;
    request.m_Filename         = (*filenames)[i];
    request.m_ExpectedChecksum = (*checksums)[i];
    BufferAppendOne(requests, heap, request);
  }

  return true;
}

int CommandLineRun(const EngineOptions* options, int argc, char** argv)
{
  if (argc < 1)
  {
    fprintf(stderr, "no command given\n");
    CommandLineShowHelp();
    return EngineResult::kSetupError;
  }

  const char* command = argv[0];
  --argc;
  ++argv;

  const bool is_verify = 0 == strcmp(command, "verify");

  if (!is_verify && 0 != strcmp(command, "sync") && 0 != strcmp(command, "recover"))
  {
    fprintf(stderr, "unknown command: %s\n", command);
    CommandLineShowHelp();
    return EngineResult::kSetupError;
  }

  if (!is_verify && argc > 0)
  {
    fprintf(stderr, "%s: unexpected argument: %s\n", command, argv[0]);
    return EngineResult::kSetupError;
  }

  MemAllocHeap heap;
  HeapInit(&heap);

  Buffer<char*>         checksums, filenames;
  Buffer<VerifyRequest> requests;
  BufferInit(&checksums);
  BufferInit(&filenames);
  BufferInit(&requests);

  int exit_code = EngineResult::kSetupError;

  if (!is_verify || CommandLineParseVerifyArgs(argc, argv, &heap, &checksums, &filenames, &requests))
  {
    Engine engine;

    if (EngineInit(&engine, options))
    {
      EngineResult::Enum result;

      if (0 == strcmp(command, "sync"))
        result = EngineSync(&engine);
      else if (0 == strcmp(command, "recover"))
        result = EngineRecover(&engine);
      else
        result = EngineVerifyFiles(&engine, requests.m_Storage, int(requests.m_Size));

      if (EngineResult::kOk != result)
        Log(kError, "%s: %s", command, EngineResult::Names[result]);

      EngineDestroy(&engine);
      exit_code = result;
    }
  }

  BufferDestroy(&requests, &heap);
  BufferDestroy(&filenames, &heap);
  BufferDestroy(&checksums, &heap);
  HeapDestroy(&heap);

  return exit_code;
}

}
