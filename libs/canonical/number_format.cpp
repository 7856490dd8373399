/**
 * @file number_format.cpp
 * @brief ECMAScript Number::toString for canonical numbers
 *
 * std::to_chars in shortest scientific form supplies the digit string
 * d1.d2...dk and exponent e of the unique shortest round-trip
 * representation. With n = e + 1 (so value = 0.d1...dk * 10^n) the
 * layout rules are:
 *   k <= n <= 21   digits followed by n - k zeros
 *   0 < n <= 21    point after the first n digits
 *   -6 < n <= 0    "0." then -n zeros then the digits
 *   otherwise      d1[.d2...dk]e(+|-)(n - 1)
 */

#include "canonjson/canonical_json.hpp"
#include "canonjson/require_cpp23.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace canonjson::canonical {

namespace {

struct DecimalDigits
{
    std::string digits;  ///< Significant digits, no leading or trailing zeros
    int exponent;        ///< n such that value = 0.digits * 10^n
};

[[nodiscard]] DecimalDigits shortest_digits(double magnitude)
{
    // "d.ddddddddddddddddde-308" fits comfortably
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(),
                                   buffer.data() + buffer.size(),
                                   magnitude,
                                   std::chars_format::scientific);
    std::string_view text(buffer.data(), ec == std::errc{} ? end : buffer.data());

    const auto e_pos = text.find('e');
    std::string_view mantissa = text.substr(0, e_pos);
    std::string_view exponent_text = text.substr(e_pos + 1);

    DecimalDigits result{.digits = std::string{}, .exponent = 0};
    result.digits.reserve(mantissa.size());
    for (char c : mantissa) {
        if (c != '.') {
            result.digits.push_back(c);
        }
    }
    while (result.digits.size() > 1 && result.digits.back() == '0') {
        result.digits.pop_back();
    }

    bool negative_exponent = false;
    if (!exponent_text.empty() && (exponent_text.front() == '+' || exponent_text.front() == '-')) {
        negative_exponent = exponent_text.front() == '-';
        exponent_text.remove_prefix(1);
    }
    int exponent = 0;
    auto [ptr, parse_ec] =
        std::from_chars(exponent_text.data(), exponent_text.data() + exponent_text.size(), exponent);
    if (parse_ec != std::errc{} || ptr != exponent_text.data() + exponent_text.size()) {
        exponent = 0;
    }
    result.exponent = (negative_exponent ? -exponent : exponent) + 1;
    return result;
}

}  // namespace

Result<std::string> format_number(double number)
{
    if (!std::isfinite(number)) {
        return std::unexpected(Error::make(
            ErrorCode::kInvalidNumber,
            std::format("{} is not a valid JSON number", std::isnan(number) ? "NaN" : "Infinity")));
    }
    // Covers -0.0 as well
    if (number == 0.0) {
        return std::string("0");
    }

    auto [digits, n] = shortest_digits(std::fabs(number));
    const int k = static_cast<int>(digits.size());

    std::string out;
    out.reserve(32);
    if (number < 0.0) {
        out.push_back('-');
    }

    if (k <= n && n <= 21) {
        out += digits;
        out.append(static_cast<std::size_t>(n - k), '0');
    } else if (0 < n && n <= 21) {
        out.append(digits, 0, static_cast<std::size_t>(n));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(n));
    } else if (-6 < n && n <= 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-n), '0');
        out += digits;
    } else {
        out.push_back(digits.front());
        if (k > 1) {
            out.push_back('.');
            out.append(digits, 1);
        }
        const int exponent = n - 1;
        out += std::format("e{}{}", exponent < 0 ? '-' : '+', exponent < 0 ? -exponent : exponent);
    }
    return out;
}

}  // namespace canonjson::canonical
