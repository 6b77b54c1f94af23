#ifndef SNAPFETCH_THREAD_HPP
#define SNAPFETCH_THREAD_HPP

#include "Common.hpp"

#include <pthread.h>

namespace sf
{

typedef pthread_t ThreadId;

typedef void* ThreadRoutineReturnType;

typedef ThreadRoutineReturnType (*ThreadRoutine)(void*);

// Start a joinable thread. The name shows up in debuggers and top; it is
// truncated to what the platform allows.
ThreadId ThreadStart(ThreadRoutine routine, void *param, const char* name);

// Start a thread nobody will join.
void ThreadStartDetached(ThreadRoutine routine, void *param, const char* name);

void ThreadJoin(ThreadId thread_id);

}

#endif
