#include "qg/json.hpp"

#include <format>

namespace qg {

std::string json_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                // other control characters (and DEL) as \u00XX; UTF-8 passes through
                if (uc < 0x20 || uc == 0x7f) out += std::format("\\u{:04x}", static_cast<unsigned>(uc));
                else out += c;
        }
    }
    return out;
}

} // namespace qg
