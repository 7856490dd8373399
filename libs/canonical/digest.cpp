/**
 * @file digest.cpp
 * @brief Digests over canonical JSON bytes
 *
 * Output format: lowercase hex of the raw digest, no prefix. hash_canonical()
 * is the exception and returns "sha256:<hex>".
 */

#include "canonjson/canonical_json.hpp"

#include "canonjson/common.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <string>

namespace canonjson::canonical {

namespace {

template <std::size_t N>
[[nodiscard]] std::vector<std::uint8_t> to_vector(const std::array<std::uint8_t, N>& digest)
{
    return {digest.begin(), digest.end()};
}

/**
 * @brief "SHA-256", "sha_256" and "sha256" all normalize to "sha256"
 */
[[nodiscard]] std::string normalize_algorithm(std::string_view algorithm)
{
    std::string normalized;
    normalized.reserve(algorithm.size());
    for (char c : algorithm) {
        if (c == '-' || c == '_') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized;
}

}  // namespace

Result<HashFunction> find_hash_function(std::string_view algorithm)
{
    const std::string name = normalize_algorithm(algorithm);
    if (name == "sha256") {
        return HashFunction{[](std::string_view data) { return to_vector(common::sha256(data)); }};
    }
    if (name == "sha384") {
        return HashFunction{[](std::string_view data) { return to_vector(common::sha384(data)); }};
    }
    if (name == "sha512") {
        return HashFunction{[](std::string_view data) { return to_vector(common::sha512(data)); }};
    }
    return std::unexpected(Error::make(
        ErrorCode::kUnsupportedAlgorithm,
        std::format("Unsupported hash algorithm: \"{}\" (expected sha-256, sha-384 or sha-512)",
                    algorithm)));
}

Result<std::string> canonical_hash(const Value& value,
                                   std::string_view algorithm,
                                   const CanonicalOptions& options)
{
    auto hash = find_hash_function(algorithm);
    if (!hash) {
        return std::unexpected(hash.error());
    }
    return canonical_hash(value, *hash, options);
}

Result<std::string> canonical_hash(const Value& value,
                                   const HashFunction& hash,
                                   const CanonicalOptions& options)
{
    if (!hash) {
        return std::unexpected(
            Error::make(ErrorCode::kUnsupportedAlgorithm, "No hash function supplied"));
    }
    auto canonical = canonicalize(value, options);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::to_hex(hash(*canonical));
}

Result<std::string> hash_canonical(const Value& value)
{
    auto canonical = canonicalize(value);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

}  // namespace canonjson::canonical
