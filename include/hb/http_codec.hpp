#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <http_parser.h>

namespace hb
{
// Incremental HTTP/1.x response reader on top of http-parser. Counts body
// bytes without keeping them and stops after the first final (non-1xx)
// response.
class ResponseParser
{
public:
    explicit ResponseParser(bool head_request = false);

    // Consumes a chunk of the stream. Returns false once the input is malformed.
    bool feed(std::string_view data);
    // The peer closed the stream: completes a close-delimited body, anything
    // else left unfinished is malformed. Returns done().
    bool finish();

    bool done() const { return done_; }
    bool failed() const { return !error_.empty(); }
    const std::string &error() const { return error_; }
    // http_errno_name() of the failure, e.g. "HPE_INVALID_CHUNK_SIZE"
    const char *error_name() const { return error_name_; }

    int status() const { return status_; }
    uint64_t body_bytes() const { return body_bytes_; }
    // Whether the connection may carry another request afterwards
    bool keep_alive() const { return keep_alive_; }

private:
    static const http_parser_settings &settings();
    static int on_headers_complete(http_parser *p);
    static int on_body(http_parser *p, const char *at, size_t len);
    static int on_message_complete(http_parser *p);

    bool fail(http_errno err, std::string msg);

    http_parser parser_{};
    bool head_request_;
    bool done_{false};
    std::string error_;
    const char *error_name_{""};

    int status_{};
    bool keep_alive_{true};
    uint64_t body_bytes_{};
};
} // namespace hb
