#ifndef SNAPFETCH_MANIFESTSOURCE_HPP
#define SNAPFETCH_MANIFESTSOURCE_HPP

#include "Common.hpp"
#include "Buffer.hpp"

namespace sf
{
  struct MemAllocHeap;

  struct ManifestSourceConfig
  {
    const char *m_BaseUrl;
    const char *m_Chain;
    const char *m_SnapshotType;
    const char *m_ManifestUrl;    // Optional; bypasses the latest pointer
    const char *m_PartBaseUrl;    // Optional
    const char *m_FetchCommand;   // Template with a {url} placeholder
    int         m_FetchTimeout;   // Seconds, 0 = no limit
  };

  // Append the document at `url` to `text_out`. file:// URLs and plain paths
  // are read directly, anything else goes through the fetch command.
  bool FetchUrlText(
      const ManifestSourceConfig* config,
      const char*                 url,
      MemAllocHeap*               heap,
      Buffer<char>*               text_out,
      char                        (&error)[1024]);

  // Base URL that relative manifest paths are resolved against.
  void ManifestSourcePartBaseUrl(const ManifestSourceConfig* config, char (&url_out)[kMaxUrlLength]);

  // Fetch the manifest text, following the latest-snapshot pointer unless an
  // explicit manifest URL is configured.
  bool ManifestSourceFetch(
      const ManifestSourceConfig* config,
      MemAllocHeap*               heap,
      Buffer<char>*               text_out,
      char                        (&error)[1024]);
}

#endif
