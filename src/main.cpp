// Render text as big FIGlet letters, once or as a color-cycling animation.
// Usage: shout [options] <text...>     (static, or --animate to stream to stdout)
//        shout --serve [options]       (HTTP: /<text>, /party/<text>, /fonts)

#include "utils/logging.h"
#include "utils/crash_handler.h"
#include "utils/string_utils.h"
#include "core/argument_parser.h"
#include "core/animation_loop.h"
#include "core/config.h"
#include "text/color_schemes.h"
#include "text/font_cache.h"
#include "text/text_layout.h"
#include "server/http_server.h"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <thread>

// Defaults, then config file, then SHOUT_* environment, then flags
static bool loadConfiguration(const Arguments& args, ShoutConfig& cfg) {
    std::string errorMsg;
    if (!args.config_file.empty() && !loadConfigFile(args.config_file, cfg, errorMsg)) {
        LOG_CERR("Error: " << errorMsg) << std::endl;
        return false;
    }
    if (!applyEnvironment(cfg, errorMsg)) {
        LOG_CERR("Error: " << errorMsg) << std::endl;
        return false;
    }

    if (!args.fonts_dir.empty()) cfg.fonts.directory = args.fonts_dir;
    if (args.port >= 0) cfg.server.publicPort = args.port;
    if (args.admin_port >= 0) cfg.server.adminPort = args.admin_port;
    if (args.max_streams >= 0) cfg.streaming.maxConcurrentStreams = args.max_streams;

    if (!validateConfig(cfg, errorMsg)) {
        LOG_CERR("Error: configuration validation failed: " << errorMsg) << std::endl;
        return false;
    }
    return true;
}

static RenderOptions optionsFromArguments(const Arguments& args, const ShoutConfig& cfg) {
    RenderOptions opts = makeDefaultRenderOptions(cfg);
    if (!args.font.empty()) opts.font = args.font;
    if (!args.color.empty()) opts.color = args.color;
    if (!args.align.empty()) opts.align = args.align;
    if (!args.border.empty()) opts.border = args.border;
    if (args.speed >= 0) opts.speed = args.speed;
    if (args.timeout >= 0) opts.timeout = args.timeout;
    if (args.max_width >= 0) opts.maxWidth = args.max_width;
    return opts;
}

static int runStatic(const std::string& text, const RenderOptions& opts, const ShoutConfig& cfg, const FontCache& fonts) {
    std::string errorMsg;
    if (!validateRenderOptions(opts, errorMsg)) {
        LOG_CERR("Error: " << errorMsg) << std::endl;
        return 1;
    }

    std::string art;
    RenderStatus status = renderLayout(sanitizeText(text, cfg.text.maxLength), opts, &fonts,
                                       cfg.fonts.defaultFont, art, errorMsg);
    if (status != RenderStatus::Ok) {
        LOG_CERR("[ERROR] " << errorMsg) << std::endl;
        return 1;
    }
    if (!opts.color.empty()) {
        art = colorizeFrame(splitLines(art), findColorScheme(opts.color), 0);
    }
    std::cout << art << std::flush;
    return std::cout.good() ? 0 : 1;
}

static int runAnimate(const std::string& text, const RenderOptions& opts, const ShoutConfig& cfg, const FontCache& fonts) {
    StreamAdmission admission(cfg.streaming.maxConcurrentStreams);
    CancellationSignal cancellation;

    // Ctrl-C drains the stream instead of killing it mid-frame
    std::thread watcher([&cancellation] {
        int sig = waitForShutdownSignal();
        LOG_DEBUG("Received signal " << sig << ", stopping stream");
        cancellation.cancel();
    });

    StreamContext ctx;
    ctx.fonts = &fonts;
    ctx.admission = &admission;
    ctx.config = &cfg;
    ctx.cancellation = &cancellation;

    StdioFrameSink sink(stdout);
    StreamResult result = runAnimatedStream(sanitizeText(text, cfg.text.maxLength), opts, ctx, sink);

    // Wake the watcher if the stream ended on its own
    if (!cancellation.isCancelled()) {
        raiseShutdownSignal();
    }
    watcher.join();

    switch (result.outcome) {
        case StreamOutcome::InvalidOptions:
        case StreamOutcome::RenderFailed:
            LOG_CERR("Error: " << result.errorMsg) << std::endl;
            return 1;
        case StreamOutcome::Rejected:
            LOG_CERR("Error: " << streamOutcomeName(result.outcome)) << std::endl;
            return 1;
        default:
            LOG_DEBUG("Stream finished: " << streamOutcomeName(result.outcome) << " after "
                      << result.framesSent << " frames");
            return 0;
    }
}

static int runServer(const ShoutConfig& cfg, const FontCache& fonts) {
    StreamAdmission admission(cfg.streaming.maxConcurrentStreams);
    CancellationSignal cancellation;
    Metrics metrics;
    RateLimiter rateLimiter(cfg.rateLimit.requestsPerMinute, cfg.rateLimit.burst);

    RouterContext ctx;
    ctx.config = &cfg;
    ctx.fonts = &fonts;
    ctx.admission = &admission;
    ctx.cancellation = &cancellation;
    ctx.metrics = &metrics;
    ctx.rateLimiter = &rateLimiter;

    HttpServer server(ctx);
    std::string errorMsg;
    if (!server.start(errorMsg)) {
        LOG_CERR("[ERROR] " << errorMsg) << std::endl;
        return 1;
    }

    int sig = waitForShutdownSignal();
    LOG_COUT("[INFO] Received signal " << sig) << std::endl;
    if (!server.stop(cancellation)) {
        // Abandoned connection threads still reference the server; do not unwind under them
        std::fflush(nullptr);
        std::_Exit(0);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    installCrashHandlers();
    installExceptionHandlers();
    ignoreBrokenPipe();
    // Before any thread exists, so every thread inherits the mask
    blockShutdownSignals();

    Arguments args;
    int parse_result = parseArguments(argc, argv, args);
    if (parse_result == 2) {
        // Help or version was shown - exit successfully
        return 0;
    }
    if (parse_result != 0) {
        return 1;
    }
    g_debug_mode = args.debug_mode;
    // Outside server mode stdout carries the art, so logs go to stderr
    g_stream_mode = !args.serve;

    ShoutConfig cfg;
    if (!loadConfiguration(args, cfg)) {
        return 1;
    }

    FontCache fonts;
    fonts.populate(cfg.fonts.directory, cfg.fonts.allowed);
    if (fonts.size() == 0) {
        LOG_CERR("[ERROR] No fonts loaded from " << cfg.fonts.directory
                 << " - check SHOUT_FONTS_PATH and SHOUT_FONTS_ALLOWED") << std::endl;
        return 1;
    }
    if (!fonts.lookup(cfg.fonts.defaultFont)) {
        LOG_CERR("[WARNING] Default font '" << cfg.fonts.defaultFont << "' is not loaded; unknown fonts will fail") << std::endl;
    }

    if (args.list_fonts) {
        for (const auto& name : fonts.list()) {
            std::cout << name << (name == cfg.fonts.defaultFont ? " (default)" : "") << "\n";
        }
        return 0;
    }

    if (args.serve) {
        return runServer(cfg, fonts);
    }

    RenderOptions opts = optionsFromArguments(args, cfg);
    if (args.animate) {
        return runAnimate(args.text, opts, cfg, fonts);
    }
    return runStatic(args.text, opts, cfg, fonts);
}
