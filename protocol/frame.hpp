#ifndef FRAME_HPP
#define FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Wire header, big-endian:
//   session_id:u32  type:u8  flags:u8  length:u32  payload[length]
constexpr size_t FRAME_HEADER_SIZE = 10;

enum class FrameType : uint8_t
{
    OPEN = 1,
    DATA = 2,
    CLOSE = 3,
    ERROR = 4,
    WINDOW = 5,
};

enum class SessionMode : uint8_t
{
    REQUEST_RESPONSE = 0,
    TUNNEL = 1,
};

enum class ErrorReason : uint8_t
{
    NONE = 0,
    MALFORMED_FRAME = 1,
    LINK_LOST = 2,
    DNS_FAILURE = 3,
    CONNECTION_REFUSED = 4,
    TIMEOUT = 5,
    CLIENT_ABORTED = 6,
    TARGET_RESET = 7,
    INVALID_STATE = 8,
    SHUTDOWN = 9,
    UNREACHABLE = 10,
};

const char *to_string(FrameType type);
const char *to_string(SessionMode mode);
const char *to_string(ErrorReason reason);

// The byte stream on the link can no longer be trusted.
class MalformedFrame : public std::runtime_error
{
public:
    explicit MalformedFrame(const std::string &what) : std::runtime_error(what) {}
};

struct Target
{
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;
    bool operator==(const Target &other) const { return host == other.host && port == other.port; }
};

struct Frame
{
    uint32_t session_id = 0;
    FrameType type = FrameType::DATA;
    std::vector<uint8_t> payload;

    bool operator==(const Frame &other) const
    {
        return session_id == other.session_id && type == other.type && payload == other.payload;
    }
    bool operator!=(const Frame &other) const { return !(*this == other); }
};

struct OpenRequest
{
    SessionMode mode = SessionMode::REQUEST_RESPONSE;
    Target target;
};

struct ErrorInfo
{
    ErrorReason reason = ErrorReason::NONE;
    std::string detail;
};

Frame make_open_frame(uint32_t session_id, SessionMode mode, const Target &target);
Frame make_open_ack_frame(uint32_t session_id);
Frame make_data_frame(uint32_t session_id, const uint8_t *data, size_t len);
Frame make_close_frame(uint32_t session_id);
Frame make_error_frame(uint32_t session_id, ErrorReason reason, const std::string &detail = std::string());
Frame make_window_frame(uint32_t session_id, uint32_t credit);

// Payload parsers throw MalformedFrame on inconsistent payloads.
OpenRequest parse_open_payload(const Frame &frame);
ErrorInfo parse_error_payload(const Frame &frame);
uint32_t parse_window_payload(const Frame &frame);

#endif
