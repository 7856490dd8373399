/**
 * @file utf8.cpp
 * @brief Strict UTF-8 decoding (RFC 3629)
 */

#include "utf8.hpp"

namespace canonjson::canonical::utf8 {

namespace {

[[nodiscard]] constexpr bool is_continuation(unsigned char byte) noexcept
{
    return (byte & 0xC0U) == 0x80U;
}

}  // namespace

std::optional<DecodedCodePoint> decode(std::string_view text, std::size_t pos)
{
    if (pos >= text.size()) {
        return std::nullopt;
    }
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80U) {
        return DecodedCodePoint{.code_point = lead, .length = 1};
    }

    std::size_t length = 0;
    char32_t code_point = 0;
    char32_t minimum = 0;
    if ((lead & 0xE0U) == 0xC0U) {
        length = 2;
        code_point = lead & 0x1FU;
        minimum = 0x80;
    } else if ((lead & 0xF0U) == 0xE0U) {
        length = 3;
        code_point = lead & 0x0FU;
        minimum = 0x800;
    } else if ((lead & 0xF8U) == 0xF0U) {
        length = 4;
        code_point = lead & 0x07U;
        minimum = 0x10000;
    } else {
        return std::nullopt;
    }

    if (text.size() - pos < length) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(byte)) {
            return std::nullopt;
        }
        code_point = (code_point << 6U) | (byte & 0x3FU);
    }

    if (code_point < minimum || code_point > 0x10FFFF
        || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return std::nullopt;
    }
    return DecodedCodePoint{.code_point = code_point, .length = length};
}

std::optional<std::u16string> to_utf16(std::string_view text)
{
    std::u16string units;
    units.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto decoded = decode(text, pos);
        if (!decoded) {
            return std::nullopt;
        }
        const char32_t cp = decoded->code_point;
        if (cp >= 0x10000) {
            const char32_t offset = cp - 0x10000;
            units.push_back(static_cast<char16_t>(0xD800 + (offset >> 10U)));
            units.push_back(static_cast<char16_t>(0xDC00 + (offset & 0x3FFU)));
        } else {
            units.push_back(static_cast<char16_t>(cp));
        }
        pos += decoded->length;
    }
    return units;
}

}  // namespace canonjson::canonical::utf8
