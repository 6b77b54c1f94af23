// ExecUnix.cpp -- subprocess spawning and output handling for unix-like systems

#include "Exec.hpp"
#include "MemAllocHeap.hpp"
#include "SignalHandler.hpp"
#include "Stats.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <sys/select.h>
#include <sys/time.h>
#include <sys/wait.h>

namespace sf
{

namespace ExecStatus
{
  const char* Names[kCount] =
  {
    "exited",
    "signalled",
    "spawn failed",
    "start timeout",
    "timeout",
    "interrupted"
  };
}

bool ExpandCommandTemplate(
    Buffer<char>*           out,
    MemAllocHeap*           heap,
    const char*             tmpl,
    const TemplateVariable* vars,
    int                     var_count,
    char                    (&error)[1024])
{
  const char* p = tmpl;

  while (*p)
  {
    const TemplateVariable* match = nullptr;

    if ('{' == *p)
    {
      for (int i = 0; i < var_count; ++i)
      {
        size_t name_len = strlen(vars[i].m_Name);
        if (0 == strncmp(p + 1, vars[i].m_Name, name_len) && '}' == p[1 + name_len])
        {
          match = &vars[i];
          break;
        }
      }
    }

    if (!match)
    {
      BufferAppendOne(out, heap, *p++);
      continue;
    }

    if (strchr(match->m_Value, '\''))
    {
      snprintf(error, sizeof error, "value for {%s} contains a single quote: %s", match->m_Name, match->m_Value);
      return false;
    }

    BufferAppendString(out, heap, match->m_Value);
    p += strlen(match->m_Name) + 2;
  }

  BufferCString(out, heap);
  return true;
}

static void SetFdNonBlocking(int fd)
{
  int flags = fcntl(fd, F_GETFL);
  flags |= O_NONBLOCK;
  if (-1 == fcntl(fd, F_SETFL, flags))
    CroakErrno("couldn't unblock fd %d", fd);
}

static void SetFdCloseOnExec(int fd)
{
  if (-1 == fcntl(fd, F_SETFD, FD_CLOEXEC))
    CroakErrno("couldn't set FD_CLOEXEC on fd %d", fd);
}

// Partial output line of one pipe, held back until its newline arrives.
struct OutputLine
{
  char   m_Text[1024];
  size_t m_Length;
};

static void FlushLine(const ExecOptions* options, OutputLine* line)
{
  if (0 == line->m_Length)
    return;

  line->m_Text[line->m_Length] = '\0';
  Log(kInfo, "%s: %s", options->m_LogPrefix, line->m_Text);
  line->m_Length = 0;
}

static void ForwardOutput(const ExecOptions* options, OutputLine* line, const char* text, size_t count)
{
  for (size_t i = 0; i < count; ++i)
  {
    char ch = text[i];

    if ('\n' == ch || '\r' == ch)
    {
      FlushLine(options, line);
      continue;
    }

    // Overlong lines are split.
    if (line->m_Length == sizeof(line->m_Text) - 1)
      FlushLine(options, line);

    line->m_Text[line->m_Length++] = ch;
  }
}

// Returns false once the pipe is closed.
static bool DrainPipe(const ExecOptions* options, int fd, bool capture, OutputLine* line)
{
  char text[8192];

  for (;;)
  {
    ssize_t count = read(fd, text, sizeof text);

    if (count > 0)
    {
      if (capture)
        BufferAppend(options->m_CaptureStdout, options->m_Heap, text, size_t(count));
      else
        ForwardOutput(options, line, text, size_t(count));
      continue;
    }

    if (count < 0 && EINTR == errno)
      continue;

    if (count < 0 && EAGAIN == errno)
      return true;

    return false;
  }
}

static bool TryReap(pid_t child, int* status_out)
{
  for (;;)
  {
    pid_t p = waitpid(child, status_out, WNOHANG);
    if (p == child)
      return true;
    if (-1 == p && EINTR == errno)
      continue;
    if (-1 == p)
      CroakErrno("waitpid failed");
    return false;
  }
}

static void KillProcessGroup(pid_t child, int* status_out)
{
  Log(kDebug, "terminating process group %d", int(child));

  kill(-child, SIGTERM);

  // Give it a couple of seconds to clean up before forcing it.
  for (int i = 0; i < 20; ++i)
  {
    if (TryReap(child, status_out))
    {
      kill(-child, SIGKILL);
      return;
    }
    usleep(100 * 1000);
  }

  kill(-child, SIGKILL);

  while (-1 == waitpid(child, status_out, 0))
  {
    if (EINTR != errno)
      CroakErrno("waitpid failed");
  }
}

static bool DeadlinePassed(uint64_t start, int seconds)
{
  return seconds > 0 && TimerDiffSeconds(start, TimerGet()) >= double(seconds);
}

ExecResult ExecuteProcess(const ExecOptions* options)
{
  TimingScope timing_scope(&g_Stats.m_ExecCount, &g_Stats.m_ExecTimeCycles);

  ExecResult result;
  result.m_Status     = ExecStatus::kSpawnFailed;
  result.m_ReturnCode = 1;
  result.m_Signal     = 0;
  result.m_Errno      = 0;

  const int pipe_read  = 0;
  const int pipe_write = 1;

  int stdout_pipe[2], stderr_pipe[2], status_pipe[2];

  if (-1 == pipe(stdout_pipe))
  {
    result.m_Errno = errno;
    return result;
  }

  if (-1 == pipe(stderr_pipe))
  {
    result.m_Errno = errno;
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    return result;
  }

  if (-1 == pipe(status_pipe))
  {
    result.m_Errno = errno;
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    return result;
  }

  // The status pipe closes silently on a successful exec. A failed exec
  // writes errno to it instead.
  SetFdCloseOnExec(status_pipe[pipe_write]);

  Log(kDebug, "exec: %s", options->m_CommandLine);

  pid_t child = fork();

  if (0 == child)
  {
    const char *args[] = { "/bin/sh", "-c", options->m_CommandLine, NULL };

    setpgid(0, 0);

    close(stdout_pipe[pipe_read]);
    close(stderr_pipe[pipe_read]);
    close(status_pipe[pipe_read]);

    int null_fd = open("/dev/null", O_RDONLY);
    if (-1 != null_fd)
    {
      dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }

    if (-1 == dup2(stdout_pipe[pipe_write], STDOUT_FILENO))
      perror("dup2 failed");
    if (-1 == dup2(stderr_pipe[pipe_write], STDERR_FILENO))
      perror("dup2 failed");

    close(stdout_pipe[pipe_write]);
    close(stderr_pipe[pipe_write]);

    sigset_t sigs;
    sigfillset(&sigs);
    if (0 != sigprocmask(SIG_UNBLOCK, &sigs, 0))
      perror("sigprocmask failed");

    execv("/bin/sh", (char **) args);

    int err = errno;
    ssize_t ignored = write(status_pipe[pipe_write], &err, sizeof err);
    (void) ignored;
    _exit(127);
  }
  else if (-1 == child)
  {
    result.m_Errno = errno;
    close(stdout_pipe[pipe_read]);
    close(stderr_pipe[pipe_read]);
    close(status_pipe[pipe_read]);
    close(stdout_pipe[pipe_write]);
    close(stderr_pipe[pipe_write]);
    close(status_pipe[pipe_write]);
    return result;
  }

  // Also done here so a kill() right after fork() already reaches the group.
  setpgid(child, child);

  close(stdout_pipe[pipe_write]);
  close(stderr_pipe[pipe_write]);
  close(status_pipe[pipe_write]);

  const uint64_t start_time = TimerGet();
  int            wait_status = 0;
  bool           reaped = false;
  bool           started = false;

  // Wait for the exec to go through.
  while (!started)
  {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(status_pipe[pipe_read], &read_fds);

    struct timeval timeout;
    timeout.tv_sec  = 0;
    timeout.tv_usec = 250000;

    int count = select(status_pipe[pipe_read] + 1, &read_fds, NULL, NULL, &timeout);

    if (count > 0)
    {
      int child_errno = 0;
      ssize_t nread = read(status_pipe[pipe_read], &child_errno, sizeof child_errno);

      if (-1 == nread && EINTR == errno)
        continue;

      if (nread == ssize_t(sizeof child_errno))
      {
        Log(kError, "couldn't exec /bin/sh: %s", strerror(child_errno));
        result.m_Errno = child_errno;
        while (-1 == waitpid(child, &wait_status, 0) && EINTR == errno)
        {
        }
        close(status_pipe[pipe_read]);
        close(stdout_pipe[pipe_read]);
        close(stderr_pipe[pipe_read]);
        return result;
      }

      started = true;
    }
    else if (SignalGetReason())
    {
      result.m_Status = ExecStatus::kInterrupted;
      break;
    }
    else if (DeadlinePassed(start_time, options->m_StartTimeoutSeconds))
    {
      Log(kError, "%s: process didn't start within %d seconds", options->m_LogPrefix, options->m_StartTimeoutSeconds);
      result.m_Status = ExecStatus::kStartTimeout;
      break;
    }
  }

  close(status_pipe[pipe_read]);

  if (!started)
  {
    KillProcessGroup(child, &wait_status);
    close(stdout_pipe[pipe_read]);
    close(stderr_pipe[pipe_read]);
    return result;
  }

  int        rfds[2] = { stdout_pipe[pipe_read], stderr_pipe[pipe_read] };
  int        rfd_count = 2;
  OutputLine lines[2];
  lines[0].m_Length = 0;
  lines[1].m_Length = 0;

  const bool capture_stdout = nullptr != options->m_CaptureStdout;

  SetFdNonBlocking(rfds[0]);
  SetFdNonBlocking(rfds[1]);

  result.m_Status = ExecStatus::kExited;

  for (;;)
  {
    struct timeval timeout;
    timeout.tv_sec  = 0;
    timeout.tv_usec = 250000;

    if (rfd_count > 0)
    {
      fd_set read_fds;
      FD_ZERO(&read_fds);
      int max_fd = 0;

      for (int i = 0; i < 2; ++i)
      {
        if (-1 != rfds[i])
        {
          FD_SET(rfds[i], &read_fds);
          if (rfds[i] > max_fd)
            max_fd = rfds[i];
        }
      }

      int count = select(max_fd + 1, &read_fds, NULL, NULL, &timeout);

      if (count > 0)
      {
        for (int i = 0; i < 2; ++i)
        {
          if (-1 != rfds[i] && FD_ISSET(rfds[i], &read_fds))
          {
            if (!DrainPipe(options, rfds[i], 0 == i && capture_stdout, &lines[i]))
            {
              close(rfds[i]);
              rfds[i] = -1;
              --rfd_count;
            }
          }
        }
      }
    }
    else
    {
      select(0, NULL, NULL, NULL, &timeout);
    }

    if (TryReap(child, &wait_status))
    {
      reaped = true;
      break;
    }

    if (SignalGetReason())
    {
      Log(kWarning, "%s: interrupted, stopping child process", options->m_LogPrefix);
      result.m_Status = ExecStatus::kInterrupted;
      break;
    }

    if (DeadlinePassed(start_time, options->m_TimeoutSeconds))
    {
      Log(kError, "%s: process still running after %d seconds, stopping it", options->m_LogPrefix, options->m_TimeoutSeconds);
      result.m_Status = ExecStatus::kTimeout;
      break;
    }
  }

  if (!reaped)
    KillProcessGroup(child, &wait_status);
  else
    kill(-child, SIGKILL); // Leftover background processes don't outlive the job.

  // Pick up whatever is still buffered in the pipes.
  for (int i = 0; i < 2; ++i)
  {
    if (-1 != rfds[i])
    {
      DrainPipe(options, rfds[i], 0 == i && capture_stdout, &lines[i]);
      close(rfds[i]);
    }
    FlushLine(options, &lines[i]);
  }

  if (ExecStatus::kExited != result.m_Status)
    return result;

  if (WIFSIGNALED(wait_status))
  {
    result.m_Status = ExecStatus::kSignalled;
    result.m_Signal = WTERMSIG(wait_status);
    Log(kWarning, "%s: child process exited on signal %d", options->m_LogPrefix, result.m_Signal);
  }
  else
  {
    result.m_ReturnCode = WEXITSTATUS(wait_status);

    if (0 != result.m_ReturnCode)
      Log(kWarning, "%s: child process failed with exit code %d", options->m_LogPrefix, result.m_ReturnCode);
  }

  return result;
}

}
