#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error model, digest primitives
 */

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace canonjson {

/**
 * @brief Failure kinds reported by the library and the CLI
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class ErrorCode {
    kInvalidNumber,         ///< NaN or Infinity reached the number formatter
    kDuplicateKey,          ///< Object holds the same key twice
    kUnsupportedType,       ///< Value outside the six JSON variants
    kDepthExceeded,         ///< Nesting beyond the configured limit
    kInvalidString,         ///< String or key is not well-formed UTF-8
    kUnsupportedAlgorithm,  ///< Unknown digest algorithm name
    kParseError,            ///< JSON text rejected by the reader
    kIoError,               ///< File could not be read or written
    kInvalidArgument        ///< Bad command-line usage
};

/**
 * @brief Stable, machine-readable name of an error code
 */
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/**
 * @brief Error information for Result types
 */
struct Error
{
    ErrorCode code;       ///< Machine-readable error kind
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(ErrorCode code, std::string message)
    {
        return Error{.code = code, .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace canonjson

namespace canonjson::common {

// ============================================================================
// SHA-2 Digests (FIPS 180-4)
// ============================================================================

using Sha256Digest = std::array<std::uint8_t, 32>;
using Sha384Digest = std::array<std::uint8_t, 48>;
using Sha512Digest = std::array<std::uint8_t, 64>;

/**
 * Compute SHA-256 digest of data
 * @param data Input bytes
 * @return 32 raw digest bytes
 */
[[nodiscard]] Sha256Digest sha256(std::string_view data);

/**
 * Compute SHA-384 digest of data (truncated SHA-512 with its own IV)
 */
[[nodiscard]] Sha384Digest sha384(std::string_view data);

/**
 * Compute SHA-512 digest of data
 */
[[nodiscard]] Sha512Digest sha512(std::string_view data);

/**
 * Lowercase hex encoding
 * @param bytes Input bytes
 * @return Two characters per byte
 */
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

}  // namespace canonjson::common
