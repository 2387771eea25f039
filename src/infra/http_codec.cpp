#include "hb/http_codec.hpp"

#include <utility>

namespace hb
{
namespace
{
bool is_interim(unsigned status)
{
    return status >= 100 && status < 200 && status != 101;
}

} // namespace

const http_parser_settings &ResponseParser::settings()
{
    static const http_parser_settings s = []
    {
        http_parser_settings init{};
        http_parser_settings_init(&init);
        init.on_headers_complete = &ResponseParser::on_headers_complete;
        init.on_body = &ResponseParser::on_body;
        init.on_message_complete = &ResponseParser::on_message_complete;
        return init;
    }();
    return s;
}

ResponseParser::ResponseParser(bool head_request)
    : head_request_(head_request)
{
    http_parser_init(&parser_, HTTP_RESPONSE);
}

int ResponseParser::on_headers_complete(http_parser *p)
{
    auto *self = static_cast<ResponseParser *>(p->data);
    self->status_ = static_cast<int>(p->status_code);
    if (is_interim(p->status_code)) return 0;

    self->keep_alive_ = http_should_keep_alive(p) != 0;
    // 1 tells the parser there is no body whatever the headers announce
    if (self->head_request_ || p->status_code == 204 || p->status_code == 304 ||
        p->status_code == 101)
        return 1;
    return 0;
}

int ResponseParser::on_body(http_parser *p, const char *, size_t len)
{
    static_cast<ResponseParser *>(p->data)->body_bytes_ += len;
    return 0;
}

int ResponseParser::on_message_complete(http_parser *p)
{
    auto *self = static_cast<ResponseParser *>(p->data);
    if (is_interim(p->status_code)) return 0;

    self->done_ = true;
    self->keep_alive_ = p->status_code != 101 && http_should_keep_alive(p) != 0;
    // anything after the response stays unparsed
    http_parser_pause(p, 1);
    return 0;
}

bool ResponseParser::fail(http_errno err, std::string msg)
{
    error_name_ = http_errno_name(err);
    error_ = std::move(msg);
    keep_alive_ = false;
    return false;
}

bool ResponseParser::feed(std::string_view data)
{
    if (failed()) return false;
    if (done_)
    {
        // bytes past the end of the response: do not trust this connection again
        if (!data.empty()) keep_alive_ = false;
        return true;
    }

    parser_.data = this;
    const size_t used = http_parser_execute(&parser_, &settings(), data.data(), data.size());
    if (done_)
    {
        if (used < data.size()) keep_alive_ = false;
        return true;
    }
    const auto err = HTTP_PARSER_ERRNO(&parser_);
    if (err != HPE_OK) return fail(err, http_errno_description(err));
    if (used != data.size()) return fail(HPE_UNKNOWN, "response parser stopped early");
    return true;
}

bool ResponseParser::finish()
{
    keep_alive_ = false;
    if (done_) return true;
    if (failed()) return false;

    // a zero-length execute signals EOF; it completes close-delimited bodies
    parser_.data = this;
    http_parser_execute(&parser_, &settings(), nullptr, 0);
    keep_alive_ = false;
    if (done_) return true;
    return fail(HPE_INVALID_EOF_STATE, "connection closed before the response was complete");
}
} // namespace hb
