#ifndef ANIMATION_LOOP_H
#define ANIMATION_LOOP_H

#include "cancellation.h"
#include "config.h"
#include "frame_sink.h"
#include "render_options.h"
#include "stream_admission.h"
#include "../text/font_cache.h"
#include <cstdint>
#include <string>

// How an animated stream ended
enum class StreamOutcome {
    InvalidOptions,    // rejected before admission
    Rejected,          // no admission slot free (capacity exceeded)
    RenderFailed,      // admitted, but the art could not be rendered; nothing was streamed
    DeadlineReached,   // effective deadline expired
    Disconnected,      // a write or flush failed
    Cancelled          // server shutdown
};

const char* streamOutcomeName(StreamOutcome outcome);

struct StreamResult {
    StreamOutcome outcome = StreamOutcome::Rejected;
    std::string errorMsg;      // set for InvalidOptions and RenderFailed
    uint64_t framesSent = 0;

    // True when the session held a slot (and has since released it)
    bool admitted() const {
        return outcome != StreamOutcome::InvalidOptions && outcome != StreamOutcome::Rejected;
    }
};

// Shared collaborators of every stream; all outlive the call
struct StreamContext {
    const FontCache* fonts = nullptr;
    StreamAdmission* admission = nullptr;
    const ShoutConfig* config = nullptr;
    const CancellationSignal* cancellation = nullptr;  // optional
};

// Stream lifecycle: Admitted -> Rendering -> Streaming -> Draining -> Closed,
// or Rejected straight away
enum class StreamState {
    Admitted,
    Rendering,
    Streaming,
    Draining,
    Closed,
    Rejected
};

const char* streamStateName(StreamState state);

// Run one animated stream to completion on the calling thread.
// Returns after the stream has closed and its admission slot has been released,
// or immediately with Rejected/InvalidOptions. Every admitted stream releases
// its slot exactly once, whichever way it ends.
StreamResult runAnimatedStream(
    const std::string& text,
    const RenderOptions& opts,
    const StreamContext& ctx,
    FrameSink& sink
);

#endif // ANIMATION_LOOP_H
