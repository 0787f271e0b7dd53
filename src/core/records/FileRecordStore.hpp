#pragma once
#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/common/Errors.hpp"
#include "core/common/Paths.hpp"
#include "core/records/FileRecord.hpp"

namespace sdi {

// destination key -> ordered member paths
using GroupMap = std::map<std::string, std::vector<std::string>>;
// path -> human readable reason the file could not be matched
using UnmatchedMap = std::map<std::string, std::string>;

// Remove `path` from every group, dropping groups left empty.
// Returns true if anything changed.
bool removeFromGroups(GroupMap& groups, const std::string& path);

/*
  Typed rows for one file category, keyed by normalized path.

  A submission is a duplicate when its path is already stored, or when a row
  with the same file name and size exists (the file was moved).
*/
template <typename Row>
class FileRecordStore {
public:
  explicit FileRecordStore(FileCategory category) : category_(category) {}
  virtual ~FileRecordStore() = default;

  // attrs must contain "path". Unknown keys are logged and ignored.
  bool addRecord(const nlohmann::json& attrs);
  std::optional<uint64_t> removeRecord(const std::string& path);
  void clear();

  FileCategory category() const { return category_; }
  std::size_t size() const { return filePaths_.size(); }
  bool contains(const std::string& path) const { return rows_.count(paths::normalize(path)) > 0; }
  const Row* find(const std::string& path) const;

  // insertion order
  const std::vector<std::string>& filePaths() const { return filePaths_; }
  std::vector<std::string> fileNames() const;
  std::optional<std::string> pathForName(const std::string& fileName) const;
  std::optional<std::string> pathForId(uint64_t id) const;

  const UnmatchedMap& unmatchedFiles() const { return unmatched_; }

  nlohmann::json toJson() const;

protected:
  void replaceUnmatched(UnmatchedMap m) { unmatched_ = std::move(m); }

  // hooks for the association maps owned by category stores
  virtual void purgeDerived(const std::string&) {}
  virtual void clearDerived() {}

private:
  bool isDuplicate(const std::string& path, const std::string& name, double sizeKB) const;

  FileCategory category_;
  std::vector<std::string> filePaths_;
  std::unordered_map<std::string, Row> rows_;
  std::unordered_map<std::string, std::string> pathByName_;
  std::map<uint64_t, std::string> pathById_;
  UnmatchedMap unmatched_;
};

// ---------- implementation ----------

template <typename Row>
bool FileRecordStore<Row>::isDuplicate(const std::string& path,
                                       const std::string& name,
                                       double sizeKB) const {
  if (rows_.count(path)) return true;
  for (const auto& kv : rows_) {
    if (kv.second.sizeKB == sizeKB && kv.second.fileName == name) return true;
  }
  return false;
}

template <typename Row>
bool FileRecordStore<Row>::addRecord(const nlohmann::json& attrs) {
  if (!attrs.is_object() || !attrs.contains("path") || !attrs["path"].is_string()) {
    std::string keys;
    if (attrs.is_object()) {
      for (auto it = attrs.begin(); it != attrs.end(); ++it) keys += (keys.empty() ? "" : ", ") + it.key();
    }
    throw InvalidInput("attribute record has no path key, found [" + keys + "]");
  }

  Row row;
  row.path = paths::normalize(attrs["path"].get<std::string>());
  row.fileName = paths::fileName(row.path);
  // build the full row first so a bad value leaves the store untouched
  for (auto it = attrs.begin(); it != attrs.end(); ++it) {
    if (!assignAttribute(row, it.key(), it.value())) {
      spdlog::warn("{} is not an attribute of the {} store", it.key(), toString(category_));
    }
  }

  if (isDuplicate(row.path, row.fileName, row.sizeKB)) {
    spdlog::error("file already exists in the {} store: {}", toString(category_), row.path);
    return false;
  }

  const std::string path = row.path;
  filePaths_.push_back(path);
  pathByName_[row.fileName] = path;
  pathById_[row.uniqueId] = path;
  spdlog::info("File {} added as {}", path, row.type);
  rows_.emplace(path, std::move(row));
  return true;
}

template <typename Row>
std::optional<uint64_t> FileRecordStore<Row>::removeRecord(const std::string& path) {
  const std::string norm = paths::normalize(path);
  auto it = rows_.find(norm);
  if (it == rows_.end()) {
    spdlog::debug("File {} is not in the {} store", norm, toString(category_));
    return std::nullopt;
  }
  const uint64_t uid = it->second.uniqueId;
  const std::string name = it->second.fileName;
  auto byId = pathById_.find(uid);
  if (byId != pathById_.end() && byId->second == norm) pathById_.erase(byId);
  rows_.erase(it);
  filePaths_.erase(std::remove(filePaths_.begin(), filePaths_.end(), norm), filePaths_.end());

  // same name, different size: the name falls back to the newest remaining row
  auto byName = pathByName_.find(name);
  if (byName != pathByName_.end() && byName->second == norm) {
    auto other = std::find_if(filePaths_.rbegin(), filePaths_.rend(),
                              [&](const std::string& p) { return rows_.at(p).fileName == name; });
    if (other != filePaths_.rend()) {
      byName->second = *other;
    } else {
      pathByName_.erase(byName);
    }
  }
  unmatched_.erase(norm);
  purgeDerived(norm);
  spdlog::info("File {} removed", norm);
  return uid;
}

template <typename Row>
void FileRecordStore<Row>::clear() {
  filePaths_.clear();
  rows_.clear();
  pathByName_.clear();
  pathById_.clear();
  unmatched_.clear();
  clearDerived();
}

template <typename Row>
const Row* FileRecordStore<Row>::find(const std::string& path) const {
  auto it = rows_.find(paths::normalize(path));
  return it == rows_.end() ? nullptr : &it->second;
}

template <typename Row>
std::vector<std::string> FileRecordStore<Row>::fileNames() const {
  std::vector<std::string> out;
  out.reserve(filePaths_.size());
  for (const auto& p : filePaths_) out.push_back(rows_.at(p).fileName);
  return out;
}

template <typename Row>
std::optional<std::string> FileRecordStore<Row>::pathForName(const std::string& fileName) const {
  auto it = pathByName_.find(fileName);
  if (it == pathByName_.end()) return std::nullopt;
  return it->second;
}

template <typename Row>
std::optional<std::string> FileRecordStore<Row>::pathForId(uint64_t id) const {
  auto it = pathById_.find(id);
  if (it == pathById_.end()) return std::nullopt;
  return it->second;
}

template <typename Row>
nlohmann::json FileRecordStore<Row>::toJson() const {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& p : filePaths_) rows.push_back(sdi::toJson(rows_.at(p)));
  return rows;
}

} // namespace sdi
