#pragma once

/**
 * @file json_reader.hpp
 * @brief JSON text and nlohmann::json to Value conversion
 *
 * The reader is SAX based so that repeated object keys survive into the
 * Value tree and are rejected by canonicalize() instead of being merged.
 */

#include "canonjson/canonical_json.hpp"
#include "canonjson/common.hpp"
#include "canonjson/value.hpp"

#include <cstddef>
#include <string_view>

#include <nlohmann/json.hpp>

namespace canonjson::reader {

struct ReaderOptions
{
    std::size_t max_depth = canonical::kDefaultMaxDepth;
};

/**
 * Parse RFC 8259 JSON text
 * @param text UTF-8 JSON document
 * @param options Depth limit
 * @return Value tree, ParseError or DepthExceeded
 */
[[nodiscard]] Result<Value> parse_json(std::string_view text, const ReaderOptions& options = {});

/**
 * Convert an nlohmann::json tree
 * @param j JSON value
 * @return Value tree, or UnsupportedType for binary/discarded values
 */
[[nodiscard]] Result<Value> from_json(const nlohmann::json& j);

/**
 * Check whether text is already in canonical form
 * @return true iff the text parses and equals its own canonicalization
 */
[[nodiscard]] bool is_canonical_json(std::string_view text);

}  // namespace canonjson::reader
