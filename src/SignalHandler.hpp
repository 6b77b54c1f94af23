#ifndef SNAPFETCH_SIGNALHANDLER_HPP
#define SNAPFETCH_SIGNALHANDLER_HPP

#include "Config.hpp"

namespace sf
{
  struct ConditionVariable;

  // Return non-null if the process has been signalled to quit.
  const char* SignalGetReason(void);

  // Call to explicitly mark the current process as signalled. Useful to pick
  // up child processes dying after being signalled and propagating that up to
  // all verification threads.
  void SignalSet(const char* reason);

  // Forget an earlier signal.
  void SignalReset(void);

  // Block SIGINT/SIGTERM/SIGQUIT in the calling thread (and every thread it
  // creates afterwards) and start a thread that waits for them. Call before any
  // other thread is started.
  void SignalHandlerInit(void);

  // Specify a condition variable which will be broadcast when a signal has
  // arrived.
  void SignalHandlerSetCondition(ConditionVariable *variable);

  // Sleep for up to `seconds`, waking early if a signal arrives. Returns false
  // if the process has been signalled.
  bool SignalWaitSeconds(int seconds);

  // Block (or unblock) all normal interruption signals for the calling thread.
  void SignalBlockThread(bool block);
}

#endif
