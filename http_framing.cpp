#include "http_framing.hpp"
#include "config.hpp"
#include "network_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace
{
    std::string to_lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(const std::string &s)
    {
        size_t begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos)
            return "";
        size_t end = s.find_last_not_of(" \t\r");
        return s.substr(begin, end - begin + 1);
    }

    bool starts_with_nocase(const std::string &s, const std::string &prefix)
    {
        return s.size() >= prefix.size() && to_lower(s.substr(0, prefix.size())) == prefix;
    }

    // Splits the head into lines; the terminating blank line is not returned.
    std::vector<std::string> split_lines(const std::string &head)
    {
        std::vector<std::string> lines;
        size_t pos = 0;
        while (pos < head.size())
        {
            size_t end = head.find("\r\n", pos);
            if (end == std::string::npos)
                end = head.size();
            if (end == pos)
                break;
            lines.push_back(head.substr(pos, end - pos));
            pos = end + 2;
        }
        return lines;
    }

    bool parse_headers(const std::vector<std::string> &lines, HeaderList &headers)
    {
        for (size_t i = 1; i < lines.size(); ++i)
        {
            auto colon = lines[i].find(':');
            if (colon == std::string::npos || colon == 0)
                return false;
            headers.emplace_back(trim(lines[i].substr(0, colon)), trim(lines[i].substr(colon + 1)));
        }
        return true;
    }

    bool parse_authority(const std::string &authority, uint16_t default_port, Target &target)
    {
        if (authority.empty())
            return false;

        std::string host = authority;
        uint16_t port = default_port;
        bool has_port = false;
        if (authority[0] == '[')
        {
            auto bracket = authority.find(']');
            if (bracket == std::string::npos)
                return false;
            has_port = bracket + 1 < authority.size();
        }
        else
        {
            has_port = authority.find(':') != std::string::npos;
        }

        if (has_port)
        {
            if (!parse_host_port(authority, host, port))
                return false;
        }
        if (host.size() > 2 && host.front() == '[' && host.back() == ']')
            host = host.substr(1, host.size() - 2);
        if (host.empty() || host.size() > 255)
            return false;

        target.host = host;
        target.port = port;
        return true;
    }

    bool is_hop_by_hop(const std::string &name)
    {
        std::string lower = to_lower(name);
        return lower == "proxy-connection" || lower == "proxy-authorization" ||
               lower == "connection" || lower == "keep-alive";
    }

    bool parse_content_length(const std::string &value, uint64_t &length)
    {
        if (value.empty() || value.size() > 18 || value.find_first_not_of("0123456789") != std::string::npos)
            return false;
        length = std::stoull(value);
        return true;
    }

    bool is_chunked(const std::string &transfer_encoding)
    {
        std::string lower = to_lower(trim(transfer_encoding));
        auto comma = lower.find_last_of(',');
        std::string last = trim(comma == std::string::npos ? lower : lower.substr(comma + 1));
        return last == "chunked";
    }

    const char *reason_phrase(int status)
    {
        switch (status)
        {
        case 400:
            return "Bad Request";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";
        default:
            return "Error";
        }
    }
}

size_t find_head_end(const std::string &buffer)
{
    size_t pos = buffer.find("\r\n\r\n");
    return pos == std::string::npos ? std::string::npos : pos + 4;
}

std::string find_header(const HeaderList &headers, const std::string &name)
{
    std::string wanted = to_lower(name);
    for (const auto &header : headers)
    {
        if (to_lower(header.first) == wanted)
            return header.second;
    }
    return "";
}

bool parse_request_head(const std::string &head, RequestHead &out, std::string &error)
{
    auto lines = split_lines(head);
    if (lines.empty())
    {
        error = "empty request";
        return false;
    }

    std::istringstream request_line(lines[0]);
    std::string uri;
    std::string extra;
    request_line >> out.method >> uri >> out.version;
    if (out.method.empty() || uri.empty() || out.version.compare(0, 5, "HTTP/") != 0 || (request_line >> extra))
    {
        error = "malformed request line";
        return false;
    }
    if (!parse_headers(lines, out.headers))
    {
        error = "malformed header line";
        return false;
    }

    if (to_lower(out.method) == "connect")
    {
        out.mode = SessionMode::TUNNEL;
        out.path = uri;
        if (!parse_authority(uri, 443, out.target))
        {
            error = "malformed CONNECT authority";
            return false;
        }
        return true;
    }

    out.mode = SessionMode::REQUEST_RESPONSE;
    if (starts_with_nocase(uri, "https://"))
    {
        error = "https targets require CONNECT";
        return false;
    }
    if (starts_with_nocase(uri, "http://"))
    {
        std::string rest = uri.substr(7);
        size_t path_start = rest.find_first_of("/?");
        std::string authority = rest.substr(0, path_start);
        auto at = authority.find('@');
        if (at != std::string::npos)
            authority = authority.substr(at + 1);
        out.path = path_start == std::string::npos ? "/" : rest.substr(path_start);
        if (!out.path.empty() && out.path[0] == '?')
            out.path = "/" + out.path;
        if (!parse_authority(authority, 80, out.target))
        {
            error = "malformed absolute URI";
            return false;
        }
        return true;
    }

    out.path = uri;
    if (!parse_authority(find_header(out.headers, "Host"), 80, out.target))
    {
        error = "missing or malformed Host header";
        return false;
    }
    return true;
}

std::string build_forward_head(const RequestHead &head)
{
    std::string result = head.method + " " + head.path + " " + head.version + "\r\n";
    bool has_host = false;
    for (const auto &header : head.headers)
    {
        if (is_hop_by_hop(header.first))
            continue;
        if (to_lower(header.first) == "host")
            has_host = true;
        result += header.first + ": " + header.second + "\r\n";
    }
    if (!has_host)
    {
        result += "Host: " + (head.target.port == 80 ? head.target.host : head.target.to_string()) + "\r\n";
    }
    result += "Connection: close\r\n\r\n";
    return result;
}

bool request_body_framer(const RequestHead &head, BodyFramer &framer, std::string &error)
{
    std::string transfer_encoding = find_header(head.headers, "Transfer-Encoding");
    if (!transfer_encoding.empty())
    {
        if (!is_chunked(transfer_encoding))
        {
            error = "unsupported request Transfer-Encoding";
            return false;
        }
        framer = BodyFramer::chunked();
        return true;
    }

    std::string content_length = find_header(head.headers, "Content-Length");
    if (content_length.empty())
    {
        framer = BodyFramer::none();
        return true;
    }
    uint64_t length = 0;
    if (!parse_content_length(content_length, length))
    {
        error = "invalid Content-Length";
        return false;
    }
    framer = BodyFramer::length(length);
    return true;
}

BodyFramer BodyFramer::none()
{
    return BodyFramer();
}

BodyFramer BodyFramer::length(uint64_t bytes)
{
    BodyFramer framer;
    framer.body_kind = Kind::LENGTH;
    framer.remaining = bytes;
    return framer;
}

BodyFramer BodyFramer::chunked()
{
    BodyFramer framer;
    framer.body_kind = Kind::CHUNKED;
    return framer;
}

BodyFramer BodyFramer::until_close()
{
    BodyFramer framer;
    framer.body_kind = Kind::UNTIL_CLOSE;
    return framer;
}

bool BodyFramer::complete() const
{
    switch (body_kind)
    {
    case Kind::NONE:
        return true;
    case Kind::LENGTH:
        return remaining == 0;
    case Kind::CHUNKED:
        return chunk_state == ChunkState::DONE;
    case Kind::UNTIL_CLOSE:
        return false;
    }
    return false;
}

size_t BodyFramer::feed(const uint8_t *data, size_t len)
{
    switch (body_kind)
    {
    case Kind::NONE:
        return 0;
    case Kind::LENGTH:
    {
        size_t take = static_cast<size_t>(std::min<uint64_t>(remaining, len));
        remaining -= take;
        return take;
    }
    case Kind::CHUNKED:
        return feed_chunked(data, len);
    case Kind::UNTIL_CLOSE:
        return len;
    }
    return 0;
}

size_t BodyFramer::feed_chunked(const uint8_t *data, size_t len)
{
    size_t pos = 0;
    while (pos < len && chunk_state != ChunkState::DONE)
    {
        if (chunk_state == ChunkState::DATA)
        {
            size_t take = static_cast<size_t>(std::min<uint64_t>(remaining, len - pos));
            remaining -= take;
            pos += take;
            if (remaining == 0)
                chunk_state = ChunkState::DATA_CRLF;
            continue;
        }

        char c = static_cast<char>(data[pos++]);
        if (c != '\n')
        {
            if (line.size() < 4096)
                line.push_back(c);
            continue;
        }

        std::string current = trim(line);
        line.clear();

        if (chunk_state == ChunkState::SIZE)
        {
            std::string size_text = current.substr(0, current.find(';'));
            size_text = trim(size_text);
            if (size_text.empty() || size_text.size() > 15 ||
                size_text.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos)
            {
                // unparseable: stop framing and pass the rest through until close
                malformed = true;
                body_kind = Kind::UNTIL_CLOSE;
                return len;
            }
            remaining = std::stoull(size_text, nullptr, 16);
            chunk_state = remaining == 0 ? ChunkState::TRAILER : ChunkState::DATA;
        }
        else if (chunk_state == ChunkState::DATA_CRLF)
        {
            chunk_state = ChunkState::SIZE;
        }
        else if (chunk_state == ChunkState::TRAILER)
        {
            if (current.empty())
                chunk_state = ChunkState::DONE;
        }
    }
    return pos;
}

void ResponseFramer::start_body()
{
    auto lines = split_lines(head);
    HeaderList headers;
    last_status = 0;

    std::istringstream status_line(lines.empty() ? std::string() : lines[0]);
    std::string version;
    status_line >> version >> last_status;
    if (version.compare(0, 5, "HTTP/") != 0 || last_status < 100 || !parse_headers(lines, headers))
    {
        body = BodyFramer::until_close();
        phase = Phase::BODY;
        return;
    }

    if (last_status == 101)
    {
        body = BodyFramer::until_close();
        phase = Phase::BODY;
        return;
    }
    if (last_status < 200)
    {
        // interim response, the final one follows
        head.clear();
        phase = Phase::HEAD;
        return;
    }
    if (head_request || last_status == 204 || last_status == 304)
    {
        phase = Phase::DONE;
        return;
    }

    std::string transfer_encoding = find_header(headers, "Transfer-Encoding");
    uint64_t length = 0;
    if (!transfer_encoding.empty() && is_chunked(transfer_encoding))
        body = BodyFramer::chunked();
    else if (transfer_encoding.empty() && parse_content_length(find_header(headers, "Content-Length"), length))
        body = BodyFramer::length(length);
    else
        body = BodyFramer::until_close();

    phase = body.complete() ? Phase::DONE : Phase::BODY;
}

size_t ResponseFramer::feed(const uint8_t *data, size_t len)
{
    size_t pos = 0;
    while (pos < len && phase != Phase::DONE)
    {
        if (phase == Phase::HEAD)
        {
            head.push_back(static_cast<char>(data[pos++]));
            if (head.size() >= 4 && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0)
            {
                start_body();
            }
            else if (head.size() > MAX_REQUEST_HEAD)
            {
                body = BodyFramer::until_close();
                phase = Phase::BODY;
            }
            continue;
        }

        pos += body.feed(data + pos, len - pos);
        if (body.complete())
            phase = Phase::DONE;
        else if (body.kind() == BodyFramer::Kind::UNTIL_CLOSE)
            pos = len;
    }
    return pos;
}

bool ResponseFramer::close_ends_response() const
{
    return phase == Phase::DONE || (phase == Phase::BODY && body.kind() == BodyFramer::Kind::UNTIL_CLOSE);
}

int status_for_reason(ErrorReason reason)
{
    switch (reason)
    {
    case ErrorReason::TIMEOUT:
        return 504;
    case ErrorReason::SHUTDOWN:
        return 503;
    default:
        return 502;
    }
}

std::string build_error_response(int status, const std::string &detail)
{
    std::string body = std::to_string(status) + " " + reason_phrase(status);
    if (!detail.empty())
        body += ": " + detail;
    body += "\n";

    return "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n" +
           "Content-Type: text/plain\r\n" +
           "Content-Length: " + std::to_string(body.size()) + "\r\n" +
           "Connection: close\r\n\r\n" + body;
}
