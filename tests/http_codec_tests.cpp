#include <iostream>
#include <string>
#include <string_view>

#include "hb/http_codec.hpp"

using namespace hb;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

// Feeds the response one byte at a time to cover every split point
static ResponseParser parse_bytewise(std::string_view wire, bool head = false)
{
    ResponseParser p(head);
    for (char c : wire)
    {
        if (!p.feed(std::string_view(&c, 1))) break;
    }
    return p;
}

static void test_content_length()
{
    const std::string wire = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nServer: x\r\n\r\nhello";
    ResponseParser p;
    assert_true(p.feed(wire), "feed ok");
    assert_true(p.done(), "done at content length");
    assert_true(p.status() == 200, "status");
    assert_true(p.body_bytes() == 5, "body bytes");
    assert_true(p.keep_alive(), "1.1 defaults to keep-alive");

    ResponseParser b = parse_bytewise(wire);
    assert_true(b.done() && b.body_bytes() == 5, "byte-wise feed gives the same result");
}

static void test_partial_until_complete()
{
    ResponseParser p;
    p.feed("HTTP/1.1 404 Not Found\r\nContent-Le");
    assert_true(!p.done() && !p.failed(), "incomplete headers");
    p.feed("ngth: 3\r\n\r\nab");
    assert_true(!p.done(), "body incomplete");
    p.feed("c");
    assert_true(p.done() && p.status() == 404 && p.body_bytes() == 3, "completes on the last byte");
}

static void test_chunked()
{
    const std::string wire =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\nWiki\r\n6;ext=1\r\npedia \r\nE\r\nin \r\n\r\nchunks.\r\n0\r\nX-Trailer: 1\r\n\r\n";
    ResponseParser p = parse_bytewise(wire);
    assert_true(p.done(), "chunked done after trailers");
    assert_true(p.body_bytes() == 4 + 6 + 14, "chunk payload counted");
    assert_true(p.keep_alive(), "chunked keeps the connection");

    ResponseParser bad;
    bad.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
    assert_true(bad.failed() && std::string_view(bad.error_name()) == "HPE_INVALID_CHUNK_SIZE", "bad chunk size");
}

static void test_no_body_cases()
{
    ResponseParser h(true);
    h.feed("HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n");
    assert_true(h.done() && h.body_bytes() == 0, "HEAD has no body");

    ResponseParser nc;
    nc.feed("HTTP/1.1 204 No Content\r\n\r\n");
    assert_true(nc.done() && nc.status() == 204, "204 has no body");

    ResponseParser nm;
    nm.feed("HTTP/1.1 304 Not Modified\r\nContent-Length: 10\r\n\r\n");
    assert_true(nm.done(), "304 has no body");
}

static void test_interim_response_skipped()
{
    ResponseParser p;
    p.feed("HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\nok");
    assert_true(p.done() && p.status() == 201 && p.body_bytes() == 2, "final status after 100");

    ResponseParser b = parse_bytewise("HTTP/1.1 103 Early Hints\r\nLink: </a>\r\n\r\n"
                                      "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    assert_true(b.done() && b.status() == 200 && b.keep_alive(), "103 skipped byte by byte");
}

static void test_switching_protocols()
{
    ResponseParser p;
    p.feed("HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n");
    assert_true(p.done() && p.status() == 101, "101 ends the response");
    assert_true(!p.keep_alive(), "upgraded connection is not reused");
}

static void test_until_close()
{
    ResponseParser p;
    p.feed("HTTP/1.0 200 OK\r\n\r\nsome body");
    assert_true(!p.done(), "waits for close");
    assert_true(!p.keep_alive(), "close-delimited body ends the connection");
    assert_true(p.finish(), "close completes the body");
    assert_true(p.body_bytes() == 9, "all bytes counted");
}

static void test_connection_header()
{
    ResponseParser close;
    close.feed("HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 0\r\n\r\n");
    assert_true(close.done() && !close.keep_alive(), "Connection: close honoured");

    ResponseParser ka;
    ka.feed("HTTP/1.0 200 OK\r\nConnection: Keep-Alive\r\nContent-Length: 0\r\n\r\n");
    assert_true(ka.done() && ka.keep_alive(), "1.0 keep-alive honoured");

    ResponseParser extra;
    extra.feed("HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\nxy");
    assert_true(extra.done() && !extra.keep_alive(), "trailing bytes distrust the connection");
}

static void test_malformed()
{
    ResponseParser a;
    assert_true(!a.feed("SMTP ready\r\n"), "not HTTP");
    assert_true(a.failed() && std::string_view(a.error_name()) == "HPE_INVALID_CONSTANT", "status line error");
    assert_true(!a.error().empty(), "error has a description");

    ResponseParser b;
    b.feed("HTTP/1.1 2x0 OK\r\n");
    assert_true(b.failed() && std::string_view(b.error_name()) == "HPE_INVALID_STATUS", "status code error");

    ResponseParser c;
    c.feed("HTTP/1.1 200 OK\r\nContent-Length: 3\r\nContent-Length: 4\r\n\r\n");
    assert_true(c.failed() && std::string_view(c.error_name()) == "HPE_UNEXPECTED_CONTENT_LENGTH", "conflicting lengths");

    ResponseParser d;
    d.feed("HTTP/1.1 200 OK\r\nno colon here\r\n\r\n");
    assert_true(d.failed() && std::string_view(d.error_name()) == "HPE_INVALID_HEADER_TOKEN", "header without colon");

    ResponseParser e;
    e.feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
    assert_true(!e.finish() && e.failed(), "truncated body is an error on close");
    assert_true(e.error() == "connection closed before the response was complete", "truncation message");
    assert_true(std::string_view(e.error_name()) == "HPE_INVALID_EOF_STATE", "truncation errno");
    assert_true(!e.feed("more"), "a failed parser stays failed");

    ResponseParser f;
    assert_true(!f.finish(), "close before anything arrived");
}

int main()
{
    test_content_length();
    test_partial_until_complete();
    test_chunked();
    test_no_body_cases();
    test_interim_response_skipped();
    test_switching_protocols();
    test_until_close();
    test_connection_header();
    test_malformed();
    std::cout << "http codec tests: OK" << std::endl;
    return 0;
}
