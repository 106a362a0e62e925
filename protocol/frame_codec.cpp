#include "frame_codec.hpp"
#include <string>

namespace
{
    void put_u32(std::vector<uint8_t> &out, uint32_t value)
    {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    uint32_t get_u32(const uint8_t *p)
    {
        return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }

    bool is_known_type(uint8_t type)
    {
        return type >= static_cast<uint8_t>(FrameType::OPEN) && type <= static_cast<uint8_t>(FrameType::WINDOW);
    }
}

void encode_frame_into(const Frame &frame, std::vector<uint8_t> &out)
{
    out.reserve(out.size() + FRAME_HEADER_SIZE + frame.payload.size());
    put_u32(out, frame.session_id);
    out.push_back(static_cast<uint8_t>(frame.type));
    out.push_back(0);
    put_u32(out, static_cast<uint32_t>(frame.payload.size()));
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
}

std::vector<uint8_t> encode_frame(const Frame &frame)
{
    std::vector<uint8_t> out;
    encode_frame_into(frame, out);
    return out;
}

FrameDecoder::FrameDecoder(uint32_t max_payload) : max_payload(max_payload)
{
}

void FrameDecoder::feed(const uint8_t *data, size_t len)
{
    if (len == 0)
        return;
    if (available() == 0)
    {
        partial = true;
        partial_since = Clock::now();
    }
    buffer.insert(buffer.end(), data, data + len);
}

bool FrameDecoder::next(Frame &frame)
{
    if (available() < FRAME_HEADER_SIZE)
        return false;

    const uint8_t *header = buffer.data() + read_offset;
    uint8_t type = header[4];
    uint8_t flags = header[5];
    uint32_t length = get_u32(header + 6);

    if (!is_known_type(type))
        throw MalformedFrame("unknown frame type " + std::to_string(type));
    if (flags != 0)
        throw MalformedFrame("non-zero frame flags " + std::to_string(flags));
    if (length > max_payload)
        throw MalformedFrame("declared payload of " + std::to_string(length) + " bytes exceeds limit");

    if (available() < FRAME_HEADER_SIZE + length)
        return false;

    frame.session_id = get_u32(header);
    frame.type = static_cast<FrameType>(type);
    frame.payload.assign(header + FRAME_HEADER_SIZE, header + FRAME_HEADER_SIZE + length);
    read_offset += FRAME_HEADER_SIZE + length;

    if (available() == 0)
    {
        partial = false;
        buffer.clear();
        read_offset = 0;
    }
    else
    {
        // the next frame starts now as far as the stall check is concerned
        partial_since = Clock::now();
        compact();
    }
    return true;
}

void FrameDecoder::compact()
{
    if (read_offset > 0 && read_offset * 2 >= buffer.size())
    {
        buffer.erase(buffer.begin(), buffer.begin() + read_offset);
        read_offset = 0;
    }
}

bool FrameDecoder::stalled(Clock::time_point now, std::chrono::milliseconds max_wait) const
{
    return partial && available() > 0 && now - partial_since > max_wait;
}

void FrameDecoder::reset()
{
    buffer.clear();
    read_offset = 0;
    partial = false;
}
