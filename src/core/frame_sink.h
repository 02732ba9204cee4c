#ifndef FRAME_SINK_H
#define FRAME_SINK_H

#include <chrono>
#include <cstdio>
#include <string>

// Destination of an animated stream. Any failed write or flush means the client
// is gone; the loop stops without retrying.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Latest moment a write may still be in progress. A write that cannot complete
    // by then (a client that stopped reading) fails. Ignored by blocking sinks.
    virtual void setWriteDeadline(std::chrono::steady_clock::time_point) {}

    // Called once, after rendering succeeded and before the first byte of the stream
    virtual bool begin() { return true; }

    virtual bool write(const std::string& data) = 0;

    // Push buffered bytes to the client so no partial frame lingers
    virtual bool flush() = 0;
};

// Writes to a stdio stream (stdout in CLI mode)
class StdioFrameSink : public FrameSink {
public:
    explicit StdioFrameSink(FILE* stream) : stream_(stream) {}

    bool write(const std::string& data) override;
    bool flush() override;

private:
    FILE* stream_;
};

#endif // FRAME_SINK_H
