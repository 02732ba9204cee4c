#include "crash_handler.h"
#include <csignal>
#include <execinfo.h>
#include <pthread.h>
#include <unistd.h>
#include <cstdio>
#include <new>
#include <exception>
#include <stdexcept>
#include <cstdlib>

static void shoutCrashHandler(int sig) {
    void* frames[128];
    int n = backtrace(frames, 128);

    const char* name = "UNKNOWN";
    switch (sig) {
        case SIGSEGV: name = "SIGSEGV"; break;
        case SIGABRT: name = "SIGABRT"; break;
        case SIGILL:  name = "SIGILL";  break;
        case SIGFPE:  name = "SIGFPE";  break;
        case SIGBUS:  name = "SIGBUS";  break;
        case SIGXCPU: name = "SIGXCPU"; break;
    }

    dprintf(STDERR_FILENO, "[ERROR] Caught signal %d (%s). Backtrace (%d frames):\n", sig, name, n);
    backtrace_symbols_fd(frames, n, STDERR_FILENO);

    _exit(128 + sig);
}

static void terminateHandler() {
    void* frames[128];
    int n = backtrace(frames, 128);
    
    dprintf(STDERR_FILENO, "[ERROR] Unhandled C++ exception. Backtrace (%d frames):\n", n);
    backtrace_symbols_fd(frames, n, STDERR_FILENO);
    
    auto current_exception = std::current_exception();
    if (current_exception) {
        try {
            std::rethrow_exception(current_exception);
        } catch (const std::bad_alloc& e) {
            dprintf(STDERR_FILENO, "[ERROR] Out of memory: std::bad_alloc caught: %s\n", e.what());
        } catch (const std::exception& e) {
            dprintf(STDERR_FILENO, "[ERROR] Exception: %s\n", e.what());
        } catch (...) {
            dprintf(STDERR_FILENO, "[ERROR] Unknown exception type\n");
        }
    } else {
        dprintf(STDERR_FILENO, "[ERROR] No active exception (std::terminate called directly)\n");
    }
    
    std::abort();
}

void installCrashHandlers() {
    std::signal(SIGSEGV, shoutCrashHandler);
    std::signal(SIGABRT, shoutCrashHandler);
    std::signal(SIGILL,  shoutCrashHandler);
    std::signal(SIGFPE,  shoutCrashHandler);
    std::signal(SIGBUS,  shoutCrashHandler);
    std::signal(SIGXCPU, shoutCrashHandler);   // CPU time limit exceeded
}

void installExceptionHandlers() {
    std::set_terminate(terminateHandler);
}

void ignoreBrokenPipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

static sigset_t shutdownSignalSet() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

void blockShutdownSignals() {
    sigset_t set = shutdownSignalSet();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

int waitForShutdownSignal() {
    sigset_t set = shutdownSignalSet();
    int sig = 0;
    while (sigwait(&set, &sig) != 0) {
        // EINTR: keep waiting
    }
    return sig;
}

void raiseShutdownSignal() {
    kill(getpid(), SIGTERM);
}
