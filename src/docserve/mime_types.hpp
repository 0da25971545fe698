#pragma once

#include <string>

namespace docserve {
namespace mime_types {

/// Convert a file extension (without the dot) into a MIME type.
/// Unknown extensions map to "application/octet-stream".
std::string extensionToType(const std::string &extension);

/// Extension of the last path segment, without the dot, or empty.
std::string extensionOf(const std::string &path);

}  // namespace mime_types
}  // namespace docserve
