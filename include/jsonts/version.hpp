#pragma once

/**
 * @file version.hpp
 * @brief jsonts version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace jsonts {

/// jsonts version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema version embedded in JSON manifests
constexpr const char* kManifestSchemaVersion = "declarations.v1";

/// Default name of the root declaration; shared declarations append `_<n>`
constexpr const char* kDefaultRootName = "DefaultType";

}  // namespace jsonts
