#include "version.h"

const char* getShoutVersion() {
    #ifdef SHOUT_VERSION
    // SHOUT_VERSION is defined at compile time (from CI/CD or the build files)
    return SHOUT_VERSION;
    #else
    // Fallback: build-time date/time macros, e.g. "dev-Jan 01 2024-12:00:00"
    return "dev-" __DATE__ "-" __TIME__;
    #endif
}
