#ifndef ARGUMENT_PARSER_H
#define ARGUMENT_PARSER_H

#include <string>

// Command-line arguments structure. Numeric options use -1 for "not given"
// so the configured default applies.
struct Arguments {
    bool serve = false;
    bool animate = false;
    bool list_fonts = false;
    bool debug_mode = false;
    std::string text;
    std::string config_file;
    std::string fonts_dir;
    std::string font;
    std::string color;
    std::string align;
    std::string border;
    int speed = -1;
    int timeout = -1;
    int max_width = -1;
    int port = -1;
    int admin_port = -1;
    int max_streams = -1;
};

// Parse command-line arguments
// Returns 0 on success, 1 on error (and prints error message), 2 if help or version was shown
int parseArguments(int argc, char* argv[], Arguments& args);

// Print usage/help message
void printUsage(const char* program_name);

#endif // ARGUMENT_PARSER_H
