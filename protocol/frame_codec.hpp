#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "frame.hpp"
#include "config.hpp"

std::vector<uint8_t> encode_frame(const Frame &frame);
void encode_frame_into(const Frame &frame, std::vector<uint8_t> &out);

// Resumable decoder: feed() raw link bytes in any split, next() hands out
// complete frames only and keeps the residual for the following read.
class FrameDecoder
{
private:
    using Clock = std::chrono::steady_clock;

    std::vector<uint8_t> buffer;
    size_t read_offset = 0;
    uint32_t max_payload;
    bool partial = false;
    Clock::time_point partial_since;

    size_t available() const { return buffer.size() - read_offset; }
    void compact();

public:
    explicit FrameDecoder(uint32_t max_payload = MAX_FRAME_PAYLOAD);

    void feed(const uint8_t *data, size_t len);

    // Throws MalformedFrame on an unknown type, non-zero flags or an oversized length.
    bool next(Frame &frame);

    size_t buffered() const { return available(); }

    // True when an incomplete frame has been waiting longer than max_wait.
    bool stalled(Clock::time_point now, std::chrono::milliseconds max_wait) const;

    void reset();
};

#endif
