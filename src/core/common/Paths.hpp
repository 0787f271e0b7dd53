#pragma once
#include <string>

namespace sdi::paths {

// Absolute, lexically normal form used as the key everywhere.
std::string normalize(const std::string& p);

std::string fileName(const std::string& p);
std::string parentDir(const std::string& p);

// Lower-cased extension including the dot, "" when there is none.
std::string extension(const std::string& p);

} // namespace sdi::paths
