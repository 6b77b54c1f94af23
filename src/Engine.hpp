#ifndef SNAPFETCH_ENGINE_HPP
#define SNAPFETCH_ENGINE_HPP

#include "MemAllocHeap.hpp"
#include "MemAllocLinear.hpp"
#include "ChecksumCache.hpp"
#include "LuaConfig.hpp"
#include "Manifest.hpp"
#include "ValidationState.hpp"
#include "VerifyQueue.hpp"

namespace sf
{

struct EngineOptions
{
  bool        m_ShowHelp;
  bool        m_Verbose;
  bool        m_DebugMessages;
  bool        m_Quiet;
  bool        m_DisplayStats;
  int         m_ThreadCount;     // -1 = from configuration
  int         m_MaxAttempts;     // -1 = from configuration
  const char *m_WorkingDir;
  const char *m_ConfigFile;      // nullptr = snapfetch.lua if present
};

void EngineOptionsInit(EngineOptions* self);

namespace EngineState
{
  enum Enum
  {
    kUnverified,
    kVerifying,
    kAllValid,
    kSomeFailed,
    kRecovering,
    kExhausted,
    kCount
  };

  extern const char* Names[kCount];
}

// Doubles as the process exit code.
namespace EngineResult
{
  enum Enum
  {
    kOk               = 0,
    kSetupError       = 1,
    kChecksumFailures = 2,
    kExhausted        = 3,
    kInterrupted      = 4,
    kCount
  };

  extern const char* Names[kCount];
}

struct Engine
{
  MemAllocHeap      m_Heap;

  // Configuration strings, manifest text
  MemAllocLinear    m_Allocator;

  EngineOptions     m_Options;
  SnapshotConfig    m_Config;

  // Absolute path of the directory holding the parts and validation state.
  char              m_WorkingDir[kMaxPathLength];

  ValidationState   m_State;
  ChecksumCache     m_Cache;
  VerifyQueue       m_Queue;
  Manifest          m_Manifest;

  EngineState::Enum m_CurrentState;
};

// Changes to the working directory, loads configuration and the checksum
// cache and starts the verification threads.
bool EngineInit(Engine* self, const EngineOptions* options);

void EngineDestroy(Engine* self);

// Fetch the manifest, download what's missing, verify and recover.
EngineResult::Enum EngineSync(Engine* self);

// Retry the files listed in the failure ledger against the stored manifest.
EngineResult::Enum EngineRecover(Engine* self);

// Verify explicit (filename, checksum) pairs without downloading anything.
EngineResult::Enum EngineVerifyFiles(Engine* self, const VerifyRequest* requests, int count);

void EngineSetState(Engine* self, EngineState::Enum state);

}

#endif
