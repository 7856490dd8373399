#pragma once

/**
 * @file version.hpp
 * @brief canonjson version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace canonjson {

/// canonjson version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Canonicalization scheme implemented by this build
constexpr const char* kSchemeVersion = "rfc8785";

}  // namespace canonjson
