#ifndef VERSION_H
#define VERSION_H

/**
 * Get the shout version string
 * @return Version string (e.g., "v1.2.3" or "dev-Jan 01 2024-12:00:00")
 */
const char* getShoutVersion();

#endif // VERSION_H
