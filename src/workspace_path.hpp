#pragma once

#include <string>

namespace bridge {

// Canonical form used as the identity key for a workspace directory:
// forward slashes, no repeated separators, "." and ".." resolved,
// no trailing separator except for a root ("/" or "C:/").
std::string NormalizeWorkspacePath(const std::string& path);

bool IsAbsoluteWorkspacePath(const std::string& path);

}  // namespace bridge
