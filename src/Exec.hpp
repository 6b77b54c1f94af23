#ifndef SNAPFETCH_EXEC_HPP
#define SNAPFETCH_EXEC_HPP

#include "Common.hpp"
#include "Buffer.hpp"

namespace sf
{
  struct MemAllocHeap;

  // A {name} placeholder and the text it expands to.
  struct TemplateVariable
  {
    const char *m_Name;
    const char *m_Value;
  };

  // Expand {name} placeholders in a command template. Placeholders without a
  // matching variable are kept verbatim. Values are meant to sit inside single
  // quotes in the template, so a value containing a single quote is rejected.
  bool ExpandCommandTemplate(
      Buffer<char>*           out,
      MemAllocHeap*           heap,
      const char*             command_template,
      const TemplateVariable* vars,
      int                     var_count,
      char                    (&error)[1024]);

  namespace ExecStatus
  {
    enum Enum
    {
      kExited       = 0, // Ran to completion, see m_ReturnCode
      kSignalled    = 1, // Killed by a signal it didn't get from us
      kSpawnFailed  = 2, // fork() or exec() failed, see m_Errno
      kStartTimeout = 3, // Didn't exec within the start timeout
      kTimeout      = 4, // Ran past the overall timeout and was killed
      kInterrupted  = 5, // We were signalled to quit and killed the child
      kCount
    };

    extern const char* Names[kCount];
  }

  struct ExecOptions
  {
    const char   *m_CommandLine;
    const char   *m_LogPrefix;           // Tag for forwarded output lines
    int           m_StartTimeoutSeconds; // 0 = no limit
    int           m_TimeoutSeconds;      // 0 = no limit
    MemAllocHeap *m_Heap;
    Buffer<char> *m_CaptureStdout;       // If null, stdout is logged like stderr
  };

  struct ExecResult
  {
    ExecStatus::Enum m_Status;
    int              m_ReturnCode;
    int              m_Signal;
    int              m_Errno;
  };

  // Run a command line through /bin/sh in its own process group. Output lines
  // are forwarded to the log at info level. Whenever the child is stopped
  // early its whole process group is killed and reaped before returning.
  ExecResult ExecuteProcess(const ExecOptions* options);

  inline bool ExecSucceeded(const ExecResult& result)
  {
    return ExecStatus::kExited == result.m_Status && 0 == result.m_ReturnCode;
  }
}

#endif
