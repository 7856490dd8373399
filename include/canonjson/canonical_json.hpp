#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing (RFC 8785)
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys ordered by UTF-16 code units
 * - No whitespace (minimal representation)
 * - Numbers in ECMAScript shortest round-trip form
 * - Minimal string escaping
 * - Arrays keep their element order
 */

#include "canonjson/common.hpp"
#include "canonjson/value.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace canonjson::canonical {

/// Nesting bound applied when the caller does not choose one
inline constexpr std::size_t kDefaultMaxDepth = 512;

struct CanonicalOptions
{
    /// Maximum number of nested arrays/objects; the root container is depth 1
    std::size_t max_depth = kDefaultMaxDepth;
};

/**
 * Format a finite double as ECMAScript Number::toString would
 * @param number Value to format
 * @return Shortest round-trip decimal text, or InvalidNumber for NaN/Infinity
 */
[[nodiscard]] Result<std::string> format_number(double number);

/**
 * Quote a UTF-8 string with the minimal JSON escape set
 * @param text UTF-8 text
 * @return Quoted text, or InvalidString for malformed UTF-8
 */
[[nodiscard]] Result<std::string> escape_string(std::string_view text);

/**
 * Compare two UTF-8 strings by their UTF-16 code unit sequences
 * @return Ordering, or InvalidString when either side is malformed
 */
[[nodiscard]] Result<std::strong_ordering> compare_utf16(std::string_view lhs,
                                                         std::string_view rhs);

/**
 * Serialize a value tree to canonical form
 * @param value Value tree
 * @param options Depth limit
 * @return Canonical UTF-8 bytes or error
 */
[[nodiscard]] Result<std::string> canonicalize(const Value& value,
                                               const CanonicalOptions& options = {});

/**
 * Size in bytes of the canonical form
 */
[[nodiscard]] Result<std::size_t> canonical_size(const Value& value,
                                                 const CanonicalOptions& options = {});

/**
 * Hash primitive: raw digest bytes of its input
 */
using HashFunction = std::function<std::vector<std::uint8_t>(std::string_view)>;

/**
 * Look up a built-in hash primitive by name
 * @param algorithm "sha-256", "sha-384" or "sha-512" (case insensitive, dash optional)
 * @return Primitive or UnsupportedAlgorithm
 */
[[nodiscard]] Result<HashFunction> find_hash_function(std::string_view algorithm);

/**
 * Digest of the canonical form
 * @param value Value tree
 * @param algorithm Name accepted by find_hash_function
 * @return Lowercase hex digest or error
 */
[[nodiscard]] Result<std::string> canonical_hash(const Value& value,
                                                 std::string_view algorithm,
                                                 const CanonicalOptions& options = {});

/**
 * Digest of the canonical form using a caller-supplied primitive
 */
[[nodiscard]] Result<std::string> canonical_hash(const Value& value,
                                                 const HashFunction& hash,
                                                 const CanonicalOptions& options = {});

/**
 * Compute SHA-256 hash of canonical JSON
 * @param value Value tree
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] Result<std::string> hash_canonical(const Value& value);

/**
 * Compare two trees by their canonical bytes
 * @return true iff both serialize identically; serialization errors propagate
 */
[[nodiscard]] Result<bool> canonically_equal(const Value& lhs,
                                             const Value& rhs,
                                             const CanonicalOptions& options = {});

}  // namespace canonjson::canonical
