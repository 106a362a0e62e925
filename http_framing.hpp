#ifndef HTTP_FRAMING_HPP
#define HTTP_FRAMING_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "protocol/frame.hpp"

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Request head as received by the ship from a local proxy client.
struct RequestHead
{
    std::string method;
    std::string version;
    std::string path;
    SessionMode mode = SessionMode::REQUEST_RESPONSE;
    Target target;
    HeaderList headers;
};

// Index just past the "\r\n\r\n" that ends a head, or std::string::npos.
size_t find_head_end(const std::string &buffer);

// Parses a complete request head. On failure returns false with a short reason.
bool parse_request_head(const std::string &head, RequestHead &out, std::string &error);

// Head forwarded to the origin: origin-form target, proxy hop-by-hop headers
// removed, "Connection: close" appended.
std::string build_forward_head(const RequestHead &head);

// Case-insensitive lookup; empty when absent.
std::string find_header(const HeaderList &headers, const std::string &name);

// Tracks where an HTTP/1.1 message body ends without buffering it.
class BodyFramer
{
public:
    enum class Kind
    {
        NONE,
        LENGTH,
        CHUNKED,
        UNTIL_CLOSE,
    };

private:
    enum class ChunkState
    {
        SIZE,
        DATA,
        DATA_CRLF,
        TRAILER,
        DONE,
    };

    Kind body_kind = Kind::NONE;
    uint64_t remaining = 0;
    ChunkState chunk_state = ChunkState::SIZE;
    std::string line;
    bool malformed = false;

    size_t feed_chunked(const uint8_t *data, size_t len);

public:
    static BodyFramer none();
    static BodyFramer length(uint64_t bytes);
    static BodyFramer chunked();
    static BodyFramer until_close();

    // Returns how many of the given bytes belong to the body.
    size_t feed(const uint8_t *data, size_t len);
    bool complete() const;
    Kind kind() const { return body_kind; }
    bool is_malformed() const { return malformed; }
};

// Chooses the request body framing from Content-Length / Transfer-Encoding.
bool request_body_framer(const RequestHead &head, BodyFramer &framer, std::string &error);

// Follows an upstream response (interim 1xx heads included) to find its end.
class ResponseFramer
{
private:
    enum class Phase
    {
        HEAD,
        BODY,
        DONE,
    };

    Phase phase = Phase::HEAD;
    bool head_request = false;
    std::string head;
    BodyFramer body;
    int last_status = 0;

    void start_body();

public:
    void set_head_request(bool value) { head_request = value; }

    // Returns how many of the given bytes belong to the response.
    size_t feed(const uint8_t *data, size_t len);
    bool complete() const { return phase == Phase::DONE; }
    // Whether an upstream close at this point ends the response cleanly.
    bool close_ends_response() const;
    int status() const { return last_status; }
};

int status_for_reason(ErrorReason reason);
std::string build_error_response(int status, const std::string &detail);

#endif
