#pragma once

/**
 * @file utf8.hpp
 * @brief Strict UTF-8 decoding shared by the escaper and key ordering
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace canonjson::canonical::utf8 {

struct DecodedCodePoint
{
    char32_t code_point;
    std::size_t length;  ///< Bytes consumed
};

/**
 * Decode one code point starting at text[pos]
 * @return nullopt for overlong forms, surrogates, values above U+10FFFF or truncation
 */
[[nodiscard]] std::optional<DecodedCodePoint> decode(std::string_view text, std::size_t pos);

/**
 * Re-encode UTF-8 text as UTF-16 code units
 * @return nullopt when text is malformed
 */
[[nodiscard]] std::optional<std::u16string> to_utf16(std::string_view text);

}  // namespace canonjson::canonical::utf8
