#include "CategoryStores.hpp"
#include <algorithm>

namespace sdi {

bool removeFromGroups(GroupMap& groups, const std::string& path) {
  bool changed = false;
  for (auto it = groups.begin(); it != groups.end();) {
    auto& members = it->second;
    auto newEnd = std::remove(members.begin(), members.end(), path);
    if (newEnd != members.end()) {
      members.erase(newEnd, members.end());
      changed = true;
    }
    if (members.empty()) {
      it = groups.erase(it);
    } else {
      ++it;
    }
  }
  return changed;
}

void MultibeamStore::setAssociations(GroupMap lineGroups, FqprMatchMap matchingFqpr, UnmatchedMap unmatched) {
  lineGroups_ = std::move(lineGroups);
  matchingFqpr_ = std::move(matchingFqpr);
  replaceUnmatched(std::move(unmatched));
}

void MultibeamStore::purgeDerived(const std::string& path) {
  removeFromGroups(lineGroups_, path);
  matchingFqpr_.erase(path);
}

void MultibeamStore::clearDerived() {
  lineGroups_.clear();
  matchingFqpr_.clear();
}

void NavigationStore::setAssociations(GroupMap navGroups, FqprMatchMap matchingFqpr, UnmatchedMap unmatched) {
  navGroups_ = std::move(navGroups);
  matchingFqpr_ = std::move(matchingFqpr);
  replaceUnmatched(std::move(unmatched));
}

void NavigationStore::purgeDerived(const std::string& path) {
  removeFromGroups(navGroups_, path);
  matchingFqpr_.erase(path);
}

void NavigationStore::clearDerived() {
  navGroups_.clear();
  matchingFqpr_.clear();
}

void SvpStore::setAssociations(GroupMap svpGroups,
                               std::map<std::string, std::vector<std::string>> matchingFqpr,
                               UnmatchedMap unmatched) {
  svpGroups_ = std::move(svpGroups);
  matchingFqpr_ = std::move(matchingFqpr);
  replaceUnmatched(std::move(unmatched));
}

void SvpStore::purgeDerived(const std::string& path) {
  removeFromGroups(svpGroups_, path);
  matchingFqpr_.erase(path);
}

void SvpStore::clearDerived() {
  svpGroups_.clear();
  matchingFqpr_.clear();
}

} // namespace sdi
