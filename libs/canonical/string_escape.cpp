/**
 * @file string_escape.cpp
 * @brief Minimal JSON string escaping and UTF-16 key ordering
 */

#include "canonjson/canonical_json.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <format>

namespace canonjson::canonical {

namespace {

[[nodiscard]] Error malformed_utf8(std::size_t offset)
{
    return Error::make(ErrorCode::kInvalidString,
                       std::format("Malformed UTF-8 sequence at byte offset {}", offset));
}

}  // namespace

Result<std::string> escape_string(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto byte = static_cast<unsigned char>(text[pos]);
        if (byte >= 0x80U) {
            // Non-ASCII passes through verbatim once it is known to be well formed
            auto decoded = utf8::decode(text, pos);
            if (!decoded) {
                return std::unexpected(malformed_utf8(pos));
            }
            out.append(text, pos, decoded->length);
            pos += decoded->length;
            continue;
        }

        switch (byte) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (byte < 0x20U) {
                    out += std::format("\\u{:04x}", static_cast<unsigned>(byte));
                } else {
                    out.push_back(static_cast<char>(byte));
                }
                break;
        }
        ++pos;
    }

    out.push_back('"');
    return out;
}

Result<std::strong_ordering> compare_utf16(std::string_view lhs, std::string_view rhs)
{
    auto lhs_units = utf8::to_utf16(lhs);
    if (!lhs_units) {
        return std::unexpected(Error::make(ErrorCode::kInvalidString, "Malformed UTF-8 in left operand"));
    }
    auto rhs_units = utf8::to_utf16(rhs);
    if (!rhs_units) {
        return std::unexpected(Error::make(ErrorCode::kInvalidString, "Malformed UTF-8 in right operand"));
    }
    return std::lexicographical_compare_three_way(
        lhs_units->begin(), lhs_units->end(), rhs_units->begin(), rhs_units->end());
}

}  // namespace canonjson::canonical
