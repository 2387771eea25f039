#include "hb/json.hpp"

namespace hb {

namespace {

constexpr char kHex[] = "0123456789abcdef";

// Short escape for c, or nullptr when c needs none (or needs \u00XX)
const char* short_escape(unsigned char c)
{
    switch (c)
    {
        case '"': return "\\\"";
        case '\\': return "\\\\";
        case '\b': return "\\b";
        case '\f': return "\\f";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        default: return nullptr;
    }
}

} // namespace

std::string json_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);

    size_t run = 0;
    for (size_t i = 0; i < s.size(); ++i)
    {
        const auto c = static_cast<unsigned char>(s[i]);
        const char* esc = short_escape(c);
        if (!esc && c >= 0x20) continue;

        out.append(s, run, i - run);
        run = i + 1;
        if (esc)
        {
            out += esc;
        }
        else
        {
            out += "\\u00";
            out += kHex[c >> 4];
            out += kHex[c & 0x0f];
        }
    }
    out.append(s, run, std::string_view::npos);
    return out;
}

std::string json_quote(std::string_view s)
{
    std::string out = "\"";
    out += json_escape(s);
    out += '"';
    return out;
}

} // namespace hb
