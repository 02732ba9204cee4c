#include "frame_sink.h"

bool StdioFrameSink::write(const std::string& data) {
    if (data.empty()) {
        return true;
    }
    size_t written = std::fwrite(data.data(), 1, data.size(), stream_);
    return written == data.size() && !std::ferror(stream_);
}

bool StdioFrameSink::flush() {
    return std::fflush(stream_) == 0 && !std::ferror(stream_);
}
