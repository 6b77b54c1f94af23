#include "ManifestSource.hpp"
#include "Exec.hpp"
#include "MemAllocHeap.hpp"

#include <errno.h>
#include <stdio.h>
#include <string.h>

namespace sf
{

static const char* LocalPathForUrl(const char* url)
{
  if (0 == strncmp(url, "file://", 7))
    return url + 7;

  if (strstr(url, "://"))
    return nullptr;

  return url;
}

bool FetchUrlText(
    const ManifestSourceConfig* config,
    const char*                 url,
    MemAllocHeap*               heap,
    Buffer<char>*               text_out,
    char                        (&error)[1024])
{
  if (const char* path = LocalPathForUrl(url))
  {
    if (!BufferReadFile(text_out, heap, path))
    {
      snprintf(error, sizeof error, "couldn't read %s: %s", path, strerror(errno));
      return false;
    }
    return true;
  }

  TemplateVariable vars[] = { { "url", url } };

  Buffer<char> cmdline;
  BufferInit(&cmdline);

  if (!ExpandCommandTemplate(&cmdline, heap, config->m_FetchCommand, vars, int(ARRAY_SIZE(vars)), error))
  {
    BufferDestroy(&cmdline, heap);
    return false;
  }

  Log(kInfo, "Fetching %s", url);

  size_t old_size = text_out->m_Size;

  ExecOptions options;
  options.m_CommandLine         = cmdline.m_Storage;
  options.m_LogPrefix           = "fetch";
  options.m_StartTimeoutSeconds = 30;
  options.m_TimeoutSeconds      = config->m_FetchTimeout;
  options.m_Heap                = heap;
  options.m_CaptureStdout       = text_out;

  ExecResult result = ExecuteProcess(&options);

  BufferDestroy(&cmdline, heap);

  if (ExecSucceeded(result))
    return true;

  text_out->m_Size = old_size;

  if (ExecStatus::kExited == result.m_Status)
    snprintf(error, sizeof error, "fetching %s failed with exit code %d", url, result.m_ReturnCode);
  else
    snprintf(error, sizeof error, "fetching %s failed: %s", url, ExecStatus::Names[result.m_Status]);

  return false;
}

static void StripTrailingSlashes(char* str)
{
  size_t len = strlen(str);
  while (len > 0 && '/' == str[len - 1])
    str[--len] = '\0';
}

void ManifestSourcePartBaseUrl(const ManifestSourceConfig* config, char (&url_out)[kMaxUrlLength])
{
  if (config->m_PartBaseUrl && config->m_PartBaseUrl[0])
  {
    snprintf(url_out, sizeof url_out, "%s", config->m_PartBaseUrl);
  }
  else
  {
    // Manifest paths include the snapshot directory.
    char base[kMaxUrlLength];
    snprintf(base, sizeof base, "%s", config->m_BaseUrl);
    StripTrailingSlashes(base);
    snprintf(url_out, sizeof url_out, "%s/%s", base, config->m_Chain);
  }

  StripTrailingSlashes(url_out);
}

static bool IsTrimSpace(char ch)
{
  return ' ' == ch || '\t' == ch || '\r' == ch || '\n' == ch;
}

static void TrimInPlace(Buffer<char>* text)
{
  if (0 == text->m_Size)
    return;

  size_t begin = 0, end = text->m_Size;

  while (begin < end && IsTrimSpace(text->m_Storage[begin]))
    ++begin;
  while (end > begin && IsTrimSpace(text->m_Storage[end - 1]))
    --end;

  memmove(text->m_Storage, text->m_Storage + begin, end - begin);
  text->m_Size = end - begin;
}

bool ManifestSourceFetch(
    const ManifestSourceConfig* config,
    MemAllocHeap*               heap,
    Buffer<char>*               text_out,
    char                        (&error)[1024])
{
  if (config->m_ManifestUrl && config->m_ManifestUrl[0])
    return FetchUrlText(config, config->m_ManifestUrl, heap, text_out, error);

  char base[kMaxUrlLength];
  snprintf(base, sizeof base, "%s", config->m_BaseUrl);
  StripTrailingSlashes(base);

  char pointer_url[kMaxUrlLength];
  snprintf(pointer_url, sizeof pointer_url, "%s/%s/latest-%s.txt", base, config->m_Chain, config->m_SnapshotType);

  Buffer<char> pointer;
  BufferInit(&pointer);

  if (!FetchUrlText(config, pointer_url, heap, &pointer, error))
  {
    BufferDestroy(&pointer, heap);
    return false;
  }

  TrimInPlace(&pointer);

  if (0 == pointer.m_Size ||
      memchr(pointer.m_Storage, '\n', pointer.m_Size) ||
      memchr(pointer.m_Storage, '\0', pointer.m_Size))
  {
    snprintf(error, sizeof error, "%s doesn't name a snapshot", pointer_url);
    BufferDestroy(&pointer, heap);
    return false;
  }

  const char* snapshot_path = BufferCString(&pointer, heap);
  while ('/' == *snapshot_path)
    ++snapshot_path;

  char manifest_url[kMaxUrlLength];
  snprintf(manifest_url, sizeof manifest_url, "%s/%s.manifest.txt", base, snapshot_path);

  Log(kInfo, "Latest %s snapshot for %s is %s", config->m_SnapshotType, config->m_Chain, snapshot_path);

  BufferDestroy(&pointer, heap);

  return FetchUrlText(config, manifest_url, heap, text_out, error);
}

}
