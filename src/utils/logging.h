#ifndef LOGGING_H
#define LOGGING_H

#include <string>
#include <sstream>
#include <iostream>

// Global flags
extern bool g_stream_mode;
extern bool g_debug_mode;

// Collects one log line and writes it in a single locked call when destroyed,
// so lines from concurrent connections never interleave
class LogLine {
public:
    explicit LogLine(std::ostream& out);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    std::ostream& stream() { return buffer_; }

private:
    std::ostream& out_;
    std::ostringstream buffer_;
};

// Helper macros for timestamped output
// In stream mode, LOG_COUT uses stderr to avoid corrupting the animation on stdout
#define LOG_COUT(msg) LogLine(g_stream_mode ? std::cerr : std::cout).stream() << msg
#define LOG_CERR(msg) LogLine(std::cerr).stream() << msg
#define LOG_DEBUG(msg) if (g_debug_mode) { LOG_COUT("[DEBUG] " << msg) << std::endl; }

// Get current timestamp as string in format [YYYY-MM-DD HH:MM:SS.nnnnnnnnn]
std::string getTimestamp();

#endif // LOGGING_H
