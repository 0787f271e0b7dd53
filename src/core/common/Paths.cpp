#include "Paths.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace sdi::paths {

std::string normalize(const std::string& p) {
  if (p.empty()) return p;
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(p), ec);
  if (ec) abs = fs::path(p);
  std::string out = abs.lexically_normal().string();
  // "dir/" normalizes with a trailing separator, drop it unless it is the root
  while (out.size() > 1 && (out.back() == '/' || out.back() == '\\')) out.pop_back();
  return out;
}

std::string fileName(const std::string& p) {
  return fs::path(p).filename().string();
}

std::string parentDir(const std::string& p) {
  return fs::path(p).parent_path().string();
}

std::string extension(const std::string& p) {
  std::string ext = fs::path(p).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

} // namespace sdi::paths
