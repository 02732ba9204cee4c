#include "router.h"
#include "../text/color_schemes.h"
#include "../text/text_layout.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include <nlohmann/json.hpp>

namespace {

const char* const kTextPlain = "text/plain; charset=utf-8";
const char* const kJson = "application/json";
const char* const kPartyPrefix = "/party/";

std::string usageText(const ShoutConfig& cfg) {
    std::string usage =
        "shout - big letters for your terminal\n"
        "\n"
        "  curl host/hello              render once\n"
        "  curl -N host/party/hello     animated, until timeout or Ctrl-C\n"
        "  curl host/fonts              list fonts\n"
        "\n"
        "options: ?f=font ?c=color ?s=speed(" + std::to_string(cfg.streaming.minSpeed) + "-" +
        std::to_string(cfg.streaming.maxSpeed) + ") ?t=timeout(s) ?mw=maxwidth\n"
        "         ?a=left|center|right ?b=none|single|double|rounded|ascii\n"
        "colors:  ";
    std::vector<std::string> schemes = listColorSchemes();
    for (size_t i = 0; i < schemes.size(); i++) {
        usage += (i ? ", " : "") + schemes[i];
    }
    usage += "\n";
    return usage;
}

bool reply(HttpResponder& out, int status, const std::string& body) {
    if (!out.sendResponse(status, kTextPlain, body)) {
        LOG_DEBUG("Client gone before " << status << " response was written");
        return false;
    }
    return true;
}

// Decode and clean the path text; empty result means nothing to render
std::string textFromPath(const std::string& encoded, const ShoutConfig& cfg) {
    return sanitizeText(percentDecode(encoded, true), static_cast<size_t>(cfg.text.maxLength));
}

void handleFonts(const RouterContext& ctx, HttpResponder& out) {
    ctx.metrics->fontRequests++;
    nlohmann::json j;
    j["fonts"] = ctx.fonts->list();
    j["default"] = ctx.config->fonts.defaultFont;
    j["colors"] = listColorSchemes();
    if (!out.sendResponse(200, kJson, j.dump() + "\n")) {
        LOG_DEBUG("Client gone before font list was written");
    }
}

void handleStatic(const std::string& text, const RenderOptions& opts, const RouterContext& ctx, HttpResponder& out) {
    ctx.metrics->staticRequests++;

    std::string art;
    std::string errorMsg;
    RenderStatus status = renderLayout(text, opts, ctx.fonts, ctx.config->fonts.defaultFont, art, errorMsg);
    if (status != RenderStatus::Ok) {
        ctx.metrics->totalErrors++;
        LOG_CERR("[ERROR] Static render failed: " << errorMsg) << std::endl;
        reply(out, 500, std::string(renderStatusName(RenderStatus::RenderFailure)) + "\n");
        return;
    }

    if (!opts.color.empty()) {
        art = colorizeFrame(splitLines(art), findColorScheme(opts.color), 0);
    }
    reply(out, 200, art);
}

void handleParty(const std::string& text, const RenderOptions& opts, const RouterContext& ctx, HttpResponder& out) {
    ctx.metrics->partyRequests++;

    StreamContext streamCtx;
    streamCtx.fonts = ctx.fonts;
    streamCtx.admission = ctx.admission;
    streamCtx.config = ctx.config;
    streamCtx.cancellation = ctx.cancellation;

    StreamResult result = runAnimatedStream(text, opts, streamCtx, out);
    switch (result.outcome) {
        case StreamOutcome::InvalidOptions:
            reply(out, 400, result.errorMsg + "\n");
            break;
        case StreamOutcome::Rejected:
            ctx.metrics->rejectedStreams++;
            reply(out, 503, "capacity exceeded, try again later\n");
            break;
        case StreamOutcome::RenderFailed:
            ctx.metrics->totalErrors++;
            reply(out, 500, std::string(renderStatusName(RenderStatus::RenderFailure)) + "\n");
            break;
        case StreamOutcome::DeadlineReached:
        case StreamOutcome::Disconnected:
        case StreamOutcome::Cancelled:
            LOG_DEBUG("Party stream ended: " << streamOutcomeName(result.outcome) << ", "
                      << result.framesSent << " frames");
            break;
    }
}

} // namespace

void handlePublicRequest(const HttpRequest& req, const std::string& client,
                         const RouterContext& ctx, HttpResponder& out) {
    if (req.method != "GET") {
        reply(out, 405, "method not allowed\n");
        return;
    }
    if (ctx.rateLimiter && !ctx.rateLimiter->allow(client)) {
        LOG_DEBUG("Rate limited " << client);
        reply(out, 429, "rate limit exceeded, slow down\n");
        return;
    }

    if (req.path == "/") {
        reply(out, 200, usageText(*ctx.config));
        return;
    }
    if (req.path == "/fonts") {
        handleFonts(ctx, out);
        return;
    }
    if (req.path == "/favicon.ico" || req.path == "/robots.txt") {
        reply(out, 404, "not found\n");
        return;
    }

    const bool party = req.path.compare(0, 7, kPartyPrefix) == 0;
    const std::string text = textFromPath(req.path.substr(party ? 7 : 1), *ctx.config);
    if (text.empty()) {
        reply(out, 400, "text is empty\n");
        return;
    }

    RenderOptions opts;
    std::string errorMsg;
    if (!renderOptionsFromQuery(req.query, *ctx.config, opts, errorMsg)) {
        reply(out, 400, errorMsg + "\n");
        return;
    }

    if (party) {
        handleParty(text, opts, ctx, out);
    } else {
        handleStatic(text, opts, ctx, out);
    }
}

void handleAdminRequest(const HttpRequest& req, const RouterContext& ctx, HttpResponder& out) {
    if (req.method != "GET") {
        reply(out, 405, "method not allowed\n");
        return;
    }
    if (req.path == "/health") {
        reply(out, 200, "ok\n");
    } else if (req.path == "/metrics") {
        nlohmann::json j = metricsToJson(*ctx.metrics, ctx.admission->activeCount(), ctx.admission->maxStreams());
        j["fonts"] = ctx.fonts->size();
        if (!out.sendResponse(200, kJson, j.dump() + "\n")) {
            LOG_DEBUG("Client gone before metrics were written");
        }
    } else {
        reply(out, 404, "not found\n");
    }
}
