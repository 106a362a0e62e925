#include <iostream>
#include <string>
#include "http_framing.hpp"
#include "test_support.hpp"

namespace
{
    size_t feed_text(BodyFramer &framer, const std::string &text)
    {
        return framer.feed(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    }

    size_t feed_text(ResponseFramer &framer, const std::string &text)
    {
        return framer.feed(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    }
}

bool test_parse_absolute_get()
{
    std::cout << "Testing absolute-form GET..." << std::endl;
    RequestHead head;
    std::string error;
    TEST_ASSERT(parse_request_head("GET http://example.com:8080/a/b?q=1 HTTP/1.1\r\n"
                                   "Host: example.com:8080\r\n"
                                   "Proxy-Connection: keep-alive\r\n"
                                   "Accept: */*\r\n\r\n",
                                   head, error),
                "valid request rejected: " << error);
    TEST_ASSERT(head.mode == SessionMode::REQUEST_RESPONSE, "GET is request/response");
    TEST_ASSERT(head.target == (Target{"example.com", 8080}), "target from the absolute URI");
    TEST_ASSERT(head.path == "/a/b?q=1", "origin-form path kept");

    std::string forwarded = build_forward_head(head);
    TEST_ASSERT(forwarded.compare(0, 28, "GET /a/b?q=1 HTTP/1.1\r\nHost:") == 0, "request line rewritten to origin-form");
    TEST_ASSERT(forwarded.find("Proxy-Connection") == std::string::npos, "proxy hop-by-hop header removed");
    TEST_ASSERT(forwarded.find("Accept: */*\r\n") != std::string::npos, "end-to-end headers kept");
    TEST_ASSERT(forwarded.size() >= 21 && forwarded.compare(forwarded.size() - 21, 21, "Connection: close\r\n\r\n") == 0,
                "Connection: close appended");
    return true;
}

bool test_parse_connect()
{
    std::cout << "Testing CONNECT..." << std::endl;
    RequestHead head;
    std::string error;
    TEST_ASSERT(parse_request_head("CONNECT example.com:443 HTTP/1.1\r\nHost: example.com:443\r\n\r\n", head, error),
                "CONNECT rejected: " << error);
    TEST_ASSERT(head.mode == SessionMode::TUNNEL, "CONNECT is a tunnel");
    TEST_ASSERT(head.target == (Target{"example.com", 443}), "CONNECT authority");

    RequestHead v6;
    TEST_ASSERT(parse_request_head("CONNECT [::1]:8443 HTTP/1.1\r\n\r\n", v6, error), "IPv6 CONNECT rejected: " << error);
    TEST_ASSERT(v6.target == (Target{"::1", 8443}), "IPv6 literal unbracketed");
    return true;
}

bool test_host_header_fallback()
{
    std::cout << "Testing origin-form with Host..." << std::endl;
    RequestHead head;
    std::string error;
    TEST_ASSERT(parse_request_head("GET /index.html HTTP/1.1\r\nhost: origin.test\r\n\r\n", head, error),
                "origin-form rejected: " << error);
    TEST_ASSERT(head.target == (Target{"origin.test", 80}), "Host header gives the target, port 80 by default");
    return true;
}

bool test_bad_requests()
{
    std::cout << "Testing malformed requests..." << std::endl;
    RequestHead head;
    std::string error;
    TEST_ASSERT(!parse_request_head("garbage\r\n\r\n", head, error), "request line without parts");
    TEST_ASSERT(!parse_request_head("GET / HTTP/1.1\r\n\r\n", head, error), "no Host and no absolute URI");
    TEST_ASSERT(!parse_request_head("GET https://secure.test/ HTTP/1.1\r\n\r\n", head, error),
                "https without CONNECT");
    TEST_ASSERT(!parse_request_head("CONNECT host:0 HTTP/1.1\r\n\r\n", head, error), "port 0");
    TEST_ASSERT(!parse_request_head("GET http://a.test/ HTTP/1.1\r\nbroken header\r\n\r\n", head, error),
                "header line without a colon");
    return true;
}

bool test_request_body_framing()
{
    std::cout << "Testing request body framing..." << std::endl;
    std::string error;

    RequestHead no_body;
    parse_request_head("GET http://a.test/ HTTP/1.1\r\n\r\n", no_body, error);
    BodyFramer framer;
    TEST_ASSERT(request_body_framer(no_body, framer, error), "GET without body");
    TEST_ASSERT(framer.complete(), "no body means complete at once");

    RequestHead with_length;
    parse_request_head("POST http://a.test/ HTTP/1.1\r\nContent-Length: 10\r\n\r\n", with_length, error);
    TEST_ASSERT(request_body_framer(with_length, framer, error), "Content-Length body");
    TEST_ASSERT(feed_text(framer, "12345") == 5 && !framer.complete(), "first half");
    TEST_ASSERT(feed_text(framer, "67890EXTRA") == 5 && framer.complete(), "bytes past the length are not body");

    RequestHead bad_length;
    parse_request_head("POST http://a.test/ HTTP/1.1\r\nContent-Length: ten\r\n\r\n", bad_length, error);
    TEST_ASSERT(!request_body_framer(bad_length, framer, error), "non-numeric Content-Length");

    RequestHead chunked;
    parse_request_head("POST http://a.test/ HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n", chunked, error);
    TEST_ASSERT(request_body_framer(chunked, framer, error), "chunked body");
    TEST_ASSERT(framer.kind() == BodyFramer::Kind::CHUNKED, "chunked framer chosen");
    return true;
}

bool test_chunked_split()
{
    std::cout << "Testing chunked body split delivery..." << std::endl;
    std::string body = "4\r\nWiki\r\n6;ext=1\r\npedia \r\nE\r\nin \r\n\r\nchunks.\r\n0\r\nTrailer: x\r\n\r\n";
    for (size_t split = 0; split <= body.size(); ++split)
    {
        BodyFramer framer = BodyFramer::chunked();
        size_t used = feed_text(framer, body.substr(0, split));
        used += feed_text(framer, body.substr(split) + "NEXT");
        TEST_ASSERT(framer.complete(), "chunked body incomplete at split " << split);
        TEST_ASSERT(used == body.size(), "chunked body consumed " << used << " bytes at split " << split);
    }
    return true;
}

bool test_response_framing()
{
    std::cout << "Testing response framing..." << std::endl;

    ResponseFramer with_length;
    std::string response = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";
    TEST_ASSERT(feed_text(with_length, response + "junk") == response.size(), "length-delimited response");
    TEST_ASSERT(with_length.complete() && with_length.status() == 200, "complete with status 200");

    ResponseFramer chunked;
    feed_text(chunked, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n");
    TEST_ASSERT(!chunked.complete(), "chunked response still open");
    TEST_ASSERT(!chunked.close_ends_response(), "close mid-chunk is a reset");
    feed_text(chunked, "0\r\n\r\n");
    TEST_ASSERT(chunked.complete(), "last chunk ends the response");

    ResponseFramer no_content;
    feed_text(no_content, "HTTP/1.1 204 No Content\r\nContent-Length: 99\r\n\r\n");
    TEST_ASSERT(no_content.complete(), "204 has no body");

    ResponseFramer head_request;
    head_request.set_head_request(true);
    feed_text(head_request, "HTTP/1.1 200 OK\r\nContent-Length: 1234\r\n\r\n");
    TEST_ASSERT(head_request.complete(), "responses to HEAD have no body");

    ResponseFramer interim;
    feed_text(interim, "HTTP/1.1 100 Continue\r\n\r\n");
    TEST_ASSERT(!interim.complete(), "100 Continue is not the final response");
    feed_text(interim, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
    TEST_ASSERT(interim.complete() && interim.status() == 200, "final response after the interim one");

    ResponseFramer until_close;
    feed_text(until_close, "HTTP/1.0 200 OK\r\n\r\nstreaming...");
    TEST_ASSERT(!until_close.complete(), "no length means read until close");
    TEST_ASSERT(until_close.close_ends_response(), "close ends an until-close body");

    ResponseFramer truncated;
    feed_text(truncated, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort");
    TEST_ASSERT(!truncated.close_ends_response(), "close before Content-Length is reached is a reset");
    return true;
}

bool test_error_responses()
{
    std::cout << "Testing synthesized responses..." << std::endl;
    TEST_ASSERT(status_for_reason(ErrorReason::DNS_FAILURE) == 502, "DNS failure is 502");
    TEST_ASSERT(status_for_reason(ErrorReason::CONNECTION_REFUSED) == 502, "refused is 502");
    TEST_ASSERT(status_for_reason(ErrorReason::LINK_LOST) == 502, "link lost is 502");
    TEST_ASSERT(status_for_reason(ErrorReason::TIMEOUT) == 504, "timeout is 504");
    TEST_ASSERT(status_for_reason(ErrorReason::SHUTDOWN) == 503, "shutdown is 503");

    std::string response = build_error_response(502, "cannot resolve nonexistent.invalid");
    TEST_ASSERT(response.find("HTTP/1.1 502 Bad Gateway\r\n") == 0, "status line");
    size_t body_start = response.find("\r\n\r\n");
    TEST_ASSERT(body_start != std::string::npos, "head terminated");
    std::string body = response.substr(body_start + 4);
    TEST_ASSERT(response.find("Content-Length: " + std::to_string(body.size()) + "\r\n") != std::string::npos,
                "Content-Length matches the body");
    TEST_ASSERT(response.find("Connection: close\r\n") != std::string::npos, "connection closes after the error");
    return true;
}

int main()
{
    std::cout << "Running HTTP Framing Tests..." << std::endl;

    test_parse_absolute_get();
    test_parse_connect();
    test_host_header_fallback();
    test_bad_requests();
    test_request_body_framing();
    test_chunked_split();
    test_response_framing();
    test_error_responses();

    return finish_tests("HTTP FRAMING");
}
