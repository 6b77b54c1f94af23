#include "LuaConfig.hpp"
#include "MemAllocHeap.hpp"
#include "MemAllocLinear.hpp"

extern "C"
{
#include "lua.h"
#include "lualib.h"
#include "lauxlib.h"
}

#include <limits.h>
#include <stdio.h>
#include <string.h>

namespace sf
{

void SnapshotConfigInit(SnapshotConfig* config)
{
  config->m_Source.m_BaseUrl      = "https://snapshot.arbitrum.foundation";
  config->m_Source.m_Chain        = "arb1";
  config->m_Source.m_SnapshotType = "pruned";
  config->m_Source.m_ManifestUrl  = nullptr;
  config->m_Source.m_PartBaseUrl  = nullptr;
  config->m_Source.m_FetchCommand = "curl -fsSL '{url}'";
  config->m_Source.m_FetchTimeout = 300;

  config->m_DownloadCommand =
    "aria2c --console-log-level=warn --summary-interval=0 -c -x 16 -j 8 -d '{dir}' -i '{input}'";

  config->m_MaxAttempts  = 3;
  config->m_RetryDelay   = 30;
  config->m_StartTimeout = 30;
  config->m_JobTimeout   = 0;
  config->m_Threads      = 0;
}

static void* LuaAllocFunc(void* ud, void* old_ptr, size_t old_size, size_t new_size)
{
  MemAllocHeap* heap = static_cast<MemAllocHeap*>(ud);
  if (new_size && old_size)
    return HeapReallocate(heap, old_ptr, new_size);
  else if (new_size)
    return HeapAllocate(heap, new_size);
  else if (old_size)
    HeapFree(heap, old_ptr);

  return nullptr;
}

static int OnLuaPanic(lua_State *)
{
  Croak("lua panic!");
}

namespace ConfigKeyType
{
  enum Enum
  {
    kString,
    kCount,     // Non-negative integer
    kPositive   // Integer >= 1
  };
}

static const struct ConfigKey
{
  const char            *m_Name;
  ConfigKeyType::Enum    m_Type;
  size_t                 m_Offset;
} s_ConfigKeys[] =
{
  { "BaseUrl",          ConfigKeyType::kString,   offsetof(SnapshotConfig, m_Source.m_BaseUrl) },
  { "Chain",            ConfigKeyType::kString,   offsetof(SnapshotConfig, m_Source.m_Chain) },
  { "SnapshotType",     ConfigKeyType::kString,   offsetof(SnapshotConfig, m_Source.m_SnapshotType) },
  { "ManifestUrl",      ConfigKeyType::kString,   offsetof(SnapshotConfig, m_Source.m_ManifestUrl) },
  { "PartBaseUrl",      ConfigKeyType::kString,   offsetof(SnapshotConfig, m_Source.m_PartBaseUrl) },
  { "FetchCommand",     ConfigKeyType::kString,   offsetof(SnapshotConfig, m_Source.m_FetchCommand) },
  { "FetchTimeout",     ConfigKeyType::kCount,    offsetof(SnapshotConfig, m_Source.m_FetchTimeout) },
  { "DownloadCommand",  ConfigKeyType::kString,   offsetof(SnapshotConfig, m_DownloadCommand) },
  { "MaxAttempts",      ConfigKeyType::kPositive, offsetof(SnapshotConfig, m_MaxAttempts) },
  { "RetryDelay",       ConfigKeyType::kCount,    offsetof(SnapshotConfig, m_RetryDelay) },
  { "StartTimeout",     ConfigKeyType::kPositive, offsetof(SnapshotConfig, m_StartTimeout) },
  { "JobTimeout",       ConfigKeyType::kCount,    offsetof(SnapshotConfig, m_JobTimeout) },
  { "Threads",          ConfigKeyType::kCount,    offsetof(SnapshotConfig, m_Threads) },
};

static const ConfigKey* FindConfigKey(const char* name)
{
  for (size_t i = 0; i < ARRAY_SIZE(s_ConfigKeys); ++i)
  {
    if (0 == strcmp(s_ConfigKeys[i].m_Name, name))
      return &s_ConfigKeys[i];
  }
  return nullptr;
}

// Reads the value at the top of the stack into the config field for `key`.
static bool AssignConfigValue(
    lua_State*        L,
    SnapshotConfig*   config,
    const ConfigKey*  key,
    MemAllocLinear*   alloc,
    char              (&error)[1024])
{
  char* dest = reinterpret_cast<char*>(config) + key->m_Offset;

  switch (key->m_Type)
  {
    case ConfigKeyType::kString:
      if (LUA_TSTRING != lua_type(L, -1))
      {
        snprintf(error, sizeof error, "Snapshot.%s: expected a string, got %s", key->m_Name, luaL_typename(L, -1));
        return false;
      }
      *reinterpret_cast<const char**>(dest) = StrDup(alloc, lua_tostring(L, -1));
      return true;

    case ConfigKeyType::kCount:
    case ConfigKeyType::kPositive:
    {
      if (LUA_TNUMBER != lua_type(L, -1))
      {
        snprintf(error, sizeof error, "Snapshot.%s: expected a number, got %s", key->m_Name, luaL_typename(L, -1));
        return false;
      }

      lua_Number value = lua_tonumber(L, -1);
      int min_value = ConfigKeyType::kPositive == key->m_Type ? 1 : 0;

      // NaN fails every comparison.
      if (!(value >= lua_Number(min_value) && value <= lua_Number(INT_MAX)) || value != lua_Number(int(value)))
      {
        snprintf(error, sizeof error, "Snapshot.%s: expected an integer >= %d, got %g", key->m_Name, min_value, double(value));
        return false;
      }

      *reinterpret_cast<int*>(dest) = int(value);
      return true;
    }
  }

  return false;
}

static bool ReadSnapshotTable(lua_State* L, SnapshotConfig* config, MemAllocLinear* alloc, char (&error)[1024])
{
  int table = lua_gettop(L);

  lua_pushnil(L);
  while (lua_next(L, table))
  {
    // Key at -2, value at -1.
    if (LUA_TSTRING != lua_type(L, -2))
    {
      snprintf(error, sizeof error, "Snapshot table keys must be strings");
      lua_pop(L, 2);
      return false;
    }

    const char* name = lua_tostring(L, -2);

    if (const ConfigKey* key = FindConfigKey(name))
    {
      if (!AssignConfigValue(L, config, key, alloc, error))
      {
        lua_pop(L, 2);
        return false;
      }
    }
    else
    {
      Log(kWarning, "ignoring unknown configuration key Snapshot.%s", name);
    }

    lua_pop(L, 1);
  }

  return true;
}

bool LuaConfigLoad(
    SnapshotConfig* config,
    const char*     filename,
    MemAllocHeap*   heap,
    MemAllocLinear* alloc,
    char            (&error)[1024])
{
  lua_State* L = lua_newstate(LuaAllocFunc, heap);
  if (!L)
  {
    snprintf(error, sizeof error, "couldn't create Lua state");
    return false;
  }

  lua_atpanic(L, OnLuaPanic);
  luaL_openlibs(L);

  bool success = false;

  if (0 != luaL_loadfile(L, filename) || 0 != lua_pcall(L, 0, 1, 0))
  {
    if (const char* msg = lua_tostring(L, -1))
      snprintf(error, sizeof error, "%s", msg);
    else
      snprintf(error, sizeof error, "%s: error object is a %s", filename, luaL_typename(L, -1));
  }
  else
  {
    // A returned table takes precedence over the global.
    if (!lua_istable(L, -1))
    {
      lua_pop(L, 1);
      lua_getglobal(L, "Snapshot");
    }

    if (!lua_istable(L, -1))
      snprintf(error, sizeof error, "%s: doesn't define a Snapshot table", filename);
    else
      success = ReadSnapshotTable(L, config, alloc, error);
  }

  lua_close(L);

  if (success)
    Log(kDebug, "loaded configuration from %s", filename);

  return success;
}

}
