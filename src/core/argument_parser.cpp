#include "argument_parser.h"
#include "../utils/logging.h"
#include "../utils/version.h"
#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <text...>\n"
              << "       " << program_name << " --serve [options]\n"
              << "\n"
              << "  --animate, -A       Stream a color-cycling animation to stdout until timeout or Ctrl-C\n"
              << "  --serve             Run the HTTP server (/<text>, /party/<text>, /fonts)\n"
              << "  --list-fonts        Print the loaded fonts and exit\n"
              << "  --font, -f <name>   Font name (falls back to the default font)\n"
              << "  --color, -c <name>  Color scheme: rainbow, fire, ocean, matrix, neon, mono\n"
              << "  --speed, -s <n>     Animation speed, clamped to the configured range\n"
              << "  --timeout, -t <s>   Animation timeout in seconds (0 = server default)\n"
              << "  --max-width, -w <n> Wrap words so the art fits n columns\n"
              << "  --align, -a <a>     left, center or right\n"
              << "  --border, -b <b>    none, single, double, rounded or ascii\n"
              << "  --fonts-dir <dir>   Directory holding <name>.flf files\n"
              << "  --config <file>     JSON configuration file\n"
              << "  --port <n>          Public HTTP port (with --serve)\n"
              << "  --admin-port <n>    Admin HTTP port (with --serve)\n"
              << "  --max-streams <n>   Maximum concurrent animated streams\n"
              << "  --debug             Enable debug output\n"
              << "  --version           Print the version and exit\n"
              << "\n"
              << "Text '-' is read from stdin. Environment variables SHOUT_* override the config file.\n";
}

static bool takeValue(int argc, char* argv[], int& i, const std::string& option, std::string& out) {
    if (i + 1 >= argc) {
        LOG_CERR("Error: " << option << " requires a value") << std::endl;
        return false;
    }
    out = argv[++i];
    return true;
}

static bool takeInt(int argc, char* argv[], int& i, const std::string& option, int& out) {
    std::string value;
    if (!takeValue(argc, argv, i, option, value)) {
        return false;
    }
    try {
        size_t consumed = 0;
        out = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        LOG_CERR("Error: Invalid value for " << option << ": " << value) << std::endl;
        return false;
    }
    return true;
}

int parseArguments(int argc, char* argv[], Arguments& args) {
    std::string text;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--serve") {
            args.serve = true;
        } else if (arg == "--animate" || arg == "-A") {
            args.animate = true;
        } else if (arg == "--list-fonts") {
            args.list_fonts = true;
        } else if (arg == "--debug") {
            args.debug_mode = true;
        } else if (arg == "--font" || arg == "-f") {
            ok = takeValue(argc, argv, i, arg, args.font);
        } else if (arg == "--color" || arg == "-c") {
            ok = takeValue(argc, argv, i, arg, args.color);
        } else if (arg == "--align" || arg == "-a") {
            ok = takeValue(argc, argv, i, arg, args.align);
        } else if (arg == "--border" || arg == "-b") {
            ok = takeValue(argc, argv, i, arg, args.border);
        } else if (arg == "--fonts-dir") {
            ok = takeValue(argc, argv, i, arg, args.fonts_dir);
        } else if (arg == "--config") {
            ok = takeValue(argc, argv, i, arg, args.config_file);
        } else if (arg == "--speed" || arg == "-s") {
            ok = takeInt(argc, argv, i, arg, args.speed);
        } else if (arg == "--timeout" || arg == "-t") {
            ok = takeInt(argc, argv, i, arg, args.timeout);
        } else if (arg == "--max-width" || arg == "-w") {
            ok = takeInt(argc, argv, i, arg, args.max_width);
        } else if (arg == "--port") {
            ok = takeInt(argc, argv, i, arg, args.port);
        } else if (arg == "--admin-port") {
            ok = takeInt(argc, argv, i, arg, args.admin_port);
        } else if (arg == "--max-streams") {
            ok = takeInt(argc, argv, i, arg, args.max_streams);
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 2;
        } else if (arg == "--version") {
            std::cout << "shout " << getShoutVersion() << std::endl;
            return 2;
        } else if (arg[0] != '-' || arg == "-") {
            // Positional words make up the text
            if (!text.empty()) {
                text += ' ';
            }
            text += arg;
        } else {
            LOG_CERR("Error: Unknown option: " << arg) << std::endl;
            LOG_CERR("Use --help for usage information.") << std::endl;
            return 1;
        }
        if (!ok) {
            return 1;
        }
    }

    if (text == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    args.text = text;

    // Validate arguments
    if (args.serve && args.animate) {
        LOG_CERR("Error: --serve and --animate cannot be combined.") << std::endl;
        return 1;
    }
    if (!args.serve && !args.list_fonts && args.text.empty()) {
        LOG_CERR("Error: Missing text.") << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    if (args.serve && !args.text.empty()) {
        LOG_CERR("Error: --serve takes no text (request it over HTTP).") << std::endl;
        return 1;
    }

    if (!args.fonts_dir.empty()) {
        std::filesystem::path fonts_path(args.fonts_dir);
        if (!std::filesystem::is_directory(fonts_path)) {
            LOG_CERR("Error: Font directory does not exist or is not a directory: " << args.fonts_dir) << std::endl;
            return 1;
        }
    }
    if (!args.config_file.empty() && !std::filesystem::is_regular_file(args.config_file)) {
        LOG_CERR("Error: Config file does not exist: " << args.config_file) << std::endl;
        return 1;
    }

    return 0;
}
