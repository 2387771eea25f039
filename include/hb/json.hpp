#pragma once

#include <string>
#include <string_view>

namespace hb {

// Escapes s for use inside a JSON string literal. Bytes >= 0x80 pass through
// untouched, so UTF-8 stays UTF-8.
std::string json_escape(std::string_view s);

// json_escape(s) wrapped in double quotes
std::string json_quote(std::string_view s);

} // namespace hb
