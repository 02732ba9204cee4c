#ifndef CRASH_HANDLER_H
#define CRASH_HANDLER_H

// Install crash handlers for signals
void installCrashHandlers();

// Install C++ exception handlers (for std::bad_alloc, etc.)
void installExceptionHandlers();

// Ignore SIGPIPE so a closed client shows up as a failed write
void ignoreBrokenPipe();

// Block SIGINT/SIGTERM in the calling thread and every thread it spawns afterwards.
// Call before starting any worker thread, then collect them with waitForShutdownSignal().
void blockShutdownSignals();

// Wait until SIGINT or SIGTERM arrives; returns the signal number
int waitForShutdownSignal();

// Deliver SIGTERM to this process (used to stop a waitForShutdownSignal() caller)
void raiseShutdownSignal();

#endif // CRASH_HANDLER_H
