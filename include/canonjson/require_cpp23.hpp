#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for canonjson
 *
 * Verifies at compile time that the standard library provides the C++23
 * features canonjson relies on. Include it early in a translation unit to
 * get a clear error when the toolchain is insufficient.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "canonjson requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Console output in the CLI
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "canonjson requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Result<T> error handling
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "canonjson requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Indexed iteration in digests and argument parsing
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "canonjson requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Word rotation in SHA-2
#if !defined(__cpp_lib_bitops) || __cpp_lib_bitops < 201'907L
    #error "canonjson requires <bit> bit operations (__cpp_lib_bitops >= 201907L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Big-endian message schedule in SHA-2
#if !defined(__cpp_lib_byteswap) || __cpp_lib_byteswap < 202'110L
    #error "canonjson requires std::byteswap (__cpp_lib_byteswap >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// Shortest round-trip double formatting in the number formatter
#if !defined(__cpp_lib_to_chars) || __cpp_lib_to_chars < 201'611L
    #error "canonjson requires floating-point std::to_chars (__cpp_lib_to_chars >= 201611L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "canonjson requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define CANONJSON_CPP23_FEATURES_VERIFIED 1
