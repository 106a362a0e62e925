#include "frame.hpp"

const char *to_string(FrameType type)
{
    switch (type)
    {
    case FrameType::OPEN:
        return "OPEN";
    case FrameType::DATA:
        return "DATA";
    case FrameType::CLOSE:
        return "CLOSE";
    case FrameType::ERROR:
        return "ERROR";
    case FrameType::WINDOW:
        return "WINDOW";
    }
    return "UNKNOWN";
}

const char *to_string(SessionMode mode)
{
    return mode == SessionMode::TUNNEL ? "TUNNEL" : "REQUEST_RESPONSE";
}

const char *to_string(ErrorReason reason)
{
    switch (reason)
    {
    case ErrorReason::NONE:
        return "None";
    case ErrorReason::MALFORMED_FRAME:
        return "MalformedFrame";
    case ErrorReason::LINK_LOST:
        return "LinkLost";
    case ErrorReason::DNS_FAILURE:
        return "DNSFailure";
    case ErrorReason::CONNECTION_REFUSED:
        return "ConnectionRefused";
    case ErrorReason::TIMEOUT:
        return "Timeout";
    case ErrorReason::CLIENT_ABORTED:
        return "ClientAborted";
    case ErrorReason::TARGET_RESET:
        return "TargetReset";
    case ErrorReason::INVALID_STATE:
        return "InvalidState";
    case ErrorReason::SHUTDOWN:
        return "Shutdown";
    case ErrorReason::UNREACHABLE:
        return "Unreachable";
    }
    return "Unknown";
}

std::string Target::to_string() const
{
    if (host.find(':') != std::string::npos)
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

Frame make_open_frame(uint32_t session_id, SessionMode mode, const Target &target)
{
    Frame frame;
    frame.session_id = session_id;
    frame.type = FrameType::OPEN;
    frame.payload.reserve(3 + target.host.size());
    frame.payload.push_back(static_cast<uint8_t>(mode));
    frame.payload.push_back(static_cast<uint8_t>(target.port >> 8));
    frame.payload.push_back(static_cast<uint8_t>(target.port & 0xff));
    frame.payload.insert(frame.payload.end(), target.host.begin(), target.host.end());
    return frame;
}

Frame make_open_ack_frame(uint32_t session_id)
{
    Frame frame;
    frame.session_id = session_id;
    frame.type = FrameType::OPEN;
    return frame;
}

Frame make_data_frame(uint32_t session_id, const uint8_t *data, size_t len)
{
    Frame frame;
    frame.session_id = session_id;
    frame.type = FrameType::DATA;
    frame.payload.assign(data, data + len);
    return frame;
}

Frame make_close_frame(uint32_t session_id)
{
    Frame frame;
    frame.session_id = session_id;
    frame.type = FrameType::CLOSE;
    return frame;
}

Frame make_error_frame(uint32_t session_id, ErrorReason reason, const std::string &detail)
{
    Frame frame;
    frame.session_id = session_id;
    frame.type = FrameType::ERROR;
    frame.payload.reserve(1 + detail.size());
    frame.payload.push_back(static_cast<uint8_t>(reason));
    frame.payload.insert(frame.payload.end(), detail.begin(), detail.end());
    return frame;
}

Frame make_window_frame(uint32_t session_id, uint32_t credit)
{
    Frame frame;
    frame.session_id = session_id;
    frame.type = FrameType::WINDOW;
    frame.payload = {
        static_cast<uint8_t>(credit >> 24),
        static_cast<uint8_t>(credit >> 16),
        static_cast<uint8_t>(credit >> 8),
        static_cast<uint8_t>(credit),
    };
    return frame;
}

OpenRequest parse_open_payload(const Frame &frame)
{
    const auto &p = frame.payload;
    if (p.size() < 4 || p.size() > 3 + 255)
        throw MalformedFrame("OPEN payload has invalid length " + std::to_string(p.size()));
    if (p[0] > static_cast<uint8_t>(SessionMode::TUNNEL))
        throw MalformedFrame("OPEN carries unknown mode " + std::to_string(p[0]));

    OpenRequest request;
    request.mode = static_cast<SessionMode>(p[0]);
    request.target.port = static_cast<uint16_t>((p[1] << 8) | p[2]);
    request.target.host.assign(p.begin() + 3, p.end());
    if (request.target.port == 0)
        throw MalformedFrame("OPEN carries port 0");
    return request;
}

ErrorInfo parse_error_payload(const Frame &frame)
{
    if (frame.payload.empty())
        throw MalformedFrame("ERROR frame without reason code");
    uint8_t code = frame.payload[0];
    if (code > static_cast<uint8_t>(ErrorReason::UNREACHABLE))
        throw MalformedFrame("ERROR frame with unknown reason " + std::to_string(code));

    ErrorInfo info;
    info.reason = static_cast<ErrorReason>(code);
    info.detail.assign(frame.payload.begin() + 1, frame.payload.end());
    return info;
}

uint32_t parse_window_payload(const Frame &frame)
{
    const auto &p = frame.payload;
    if (p.size() != 4)
        throw MalformedFrame("WINDOW payload must be 4 bytes");
    uint32_t credit = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    if (credit == 0)
        throw MalformedFrame("WINDOW frame with zero credit");
    return credit;
}
