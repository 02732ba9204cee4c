#include "animation_loop.h"
#include "../text/color_schemes.h"
#include "../text/text_layout.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

namespace {

using Clock = CancellationSignal::Clock;

// Per-stream state, destroyed when runAnimatedStream returns
struct AnimationSession {
    AdmissionSlot slot;
    StreamState state = StreamState::Admitted;
    std::vector<std::string> lines;     // immutable once rendered
    uint64_t frameIndex = 0;            // only ever increases
    Clock::time_point requestedDeadline;
    Clock::time_point serverDeadline;

    Clock::time_point deadline() const { return std::min(requestedDeadline, serverDeadline); }

    void transition(StreamState next) {
        LOG_DEBUG("Stream " << streamStateName(state) << " -> " << streamStateName(next));
        state = next;
    }
};

bool writeAndFlush(FrameSink& sink, const std::string& data) {
    return sink.write(data) && sink.flush();
}

// Wait for the next tick, the deadline or cancellation, whichever comes first.
// Returns true if cancelled.
bool waitForTick(const CancellationSignal* cancellation, Clock::time_point wake) {
    if (cancellation) {
        return cancellation->waitUntil(wake);
    }
    std::this_thread::sleep_until(wake);
    return false;
}

void drain(AnimationSession& session, FrameSink& sink) {
    session.transition(StreamState::Draining);
    // Best effort: the client may already be gone
    if (!writeAndFlush(sink, std::string(kAnsiReset) + kAnsiShowCursor + "\n")) {
        LOG_DEBUG("Client gone before final color reset");
    }
}

} // namespace

const char* streamOutcomeName(StreamOutcome outcome) {
    switch (outcome) {
        case StreamOutcome::InvalidOptions: return "invalid options";
        case StreamOutcome::Rejected: return "capacity exceeded";
        case StreamOutcome::RenderFailed: return "render failed";
        case StreamOutcome::DeadlineReached: return "deadline reached";
        case StreamOutcome::Disconnected: return "client disconnected";
        case StreamOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* streamStateName(StreamState state) {
    switch (state) {
        case StreamState::Admitted: return "Admitted";
        case StreamState::Rendering: return "Rendering";
        case StreamState::Streaming: return "Streaming";
        case StreamState::Draining: return "Draining";
        case StreamState::Closed: return "Closed";
        case StreamState::Rejected: return "Rejected";
    }
    return "Unknown";
}

StreamResult runAnimatedStream(
    const std::string& text,
    const RenderOptions& opts,
    const StreamContext& ctx,
    FrameSink& sink
) {
    StreamResult result;
    const StreamingConfig& streaming = ctx.config->streaming;

    // Validation happens before any scarce resource is taken
    const std::string cleaned = sanitizeText(text, 0);
    if (cleaned.empty()) {
        result.outcome = StreamOutcome::InvalidOptions;
        result.errorMsg = "text is empty";
        return result;
    }
    if (!validateRenderOptions(opts, result.errorMsg)) {
        result.outcome = StreamOutcome::InvalidOptions;
        return result;
    }

    AnimationSession session;
    session.slot = AdmissionSlot(*ctx.admission);
    if (!session.slot.held()) {
        session.state = StreamState::Rejected;
        result.outcome = StreamOutcome::Rejected;
        LOG_CERR("[WARNING] Stream rejected: " << ctx.admission->activeCount() << "/"
                 << ctx.admission->maxStreams() << " streams active") << std::endl;
        return result;
    }

    // From here on the slot is released when `session` goes out of scope,
    // on every path including exceptions
    session.transition(StreamState::Rendering);
    std::string art;
    RenderStatus status = renderLayout(cleaned, opts, ctx.fonts, ctx.config->fonts.defaultFont, art, result.errorMsg);
    if (status != RenderStatus::Ok) {
        LOG_CERR("[ERROR] Stream render failed: " << result.errorMsg) << std::endl;
        result.outcome = StreamOutcome::RenderFailed;
        session.transition(StreamState::Draining);
        session.slot.release();
        session.transition(StreamState::Closed);
        return result;
    }
    session.lines = splitLines(art);

    const std::chrono::milliseconds interval = frameInterval(opts.speed, streaming);
    const Clock::time_point start = Clock::now();
    const std::chrono::milliseconds requested = opts.timeout > 0
        ? std::chrono::milliseconds(std::chrono::seconds(opts.timeout))
        : streaming.defaultTimeout;
    session.requestedDeadline = start + requested;
    session.serverDeadline = start + streaming.maxTimeout;
    const ColorScheme& scheme = findColorScheme(opts.color);

    LOG_DEBUG("Streaming " << session.lines.size() << " lines, scheme " << scheme.name << ", interval "
              << interval.count() << "ms, deadline "
              << std::chrono::duration_cast<std::chrono::milliseconds>(session.deadline() - start).count() << "ms");

    session.transition(StreamState::Streaming);
    sink.setWriteDeadline(session.deadline());
    if (!sink.begin() || !writeAndFlush(sink, std::string(kAnsiClearScreen) + kAnsiHideCursor)) {
        result.outcome = StreamOutcome::Disconnected;
    } else {
        Clock::time_point nextTick = start;
        while (true) {
            std::string frame = kAnsiCursorHome;
            frame += colorizeFrame(session.lines, scheme, session.frameIndex);
            if (!writeAndFlush(sink, frame)) {
                result.outcome = StreamOutcome::Disconnected;
                break;
            }
            session.frameIndex++;
            result.framesSent++;

            // Fixed cadence; if a slow write made us miss ticks, resume from now
            nextTick = std::max(nextTick + interval, Clock::now());
            const Clock::time_point wake = std::min(nextTick, session.deadline());
            if (waitForTick(ctx.cancellation, wake)) {
                result.outcome = StreamOutcome::Cancelled;
                break;
            }
            if (Clock::now() >= session.deadline()) {
                result.outcome = StreamOutcome::DeadlineReached;
                break;
            }
        }
    }

    drain(session, sink);
    session.slot.release();
    session.transition(StreamState::Closed);

    LOG_DEBUG("Stream closed (" << streamOutcomeName(result.outcome) << ") after " << result.framesSent << " frames");
    return result;
}
