#pragma once
#include <map>
#include <string>
#include <vector>

#include "core/records/FileRecordStore.hpp"

namespace sdi {

// path -> matched project instance key ("" when unmatched)
using FqprMatchMap = std::map<std::string, std::string>;
// own path -> navigation path, or navigation path -> own path
using LinkMap = std::map<std::string, std::string>;

class MultibeamStore : public FileRecordStore<MultibeamRecord> {
public:
  MultibeamStore() : FileRecordStore(FileCategory::Multibeam) {}

  const GroupMap& lineGroups() const { return lineGroups_; }
  const FqprMatchMap& matchingFqpr() const { return matchingFqpr_; }

  // Replaces the association maps as a whole, never patches them.
  void setAssociations(GroupMap lineGroups, FqprMatchMap matchingFqpr, UnmatchedMap unmatched);

protected:
  void purgeDerived(const std::string& path) override;
  void clearDerived() override;

private:
  GroupMap lineGroups_;
  FqprMatchMap matchingFqpr_;
};

class NavigationStore : public FileRecordStore<NavigationRecord> {
public:
  NavigationStore() : FileRecordStore(FileCategory::Navigation) {}

  const GroupMap& navGroups() const { return navGroups_; }
  const FqprMatchMap& matchingFqpr() const { return matchingFqpr_; }

  void setAssociations(GroupMap navGroups, FqprMatchMap matchingFqpr, UnmatchedMap unmatched);

protected:
  void purgeDerived(const std::string& path) override;
  void clearDerived() override;

private:
  GroupMap navGroups_;
  FqprMatchMap matchingFqpr_;
};

// Stores whose files pair up one to one with a navigation (SBET) file.
template <typename Row>
class SbetLinkedStore : public FileRecordStore<Row> {
public:
  explicit SbetLinkedStore(FileCategory category) : FileRecordStore<Row>(category) {}

  const LinkMap& matchingSbet() const { return matchingSbet_; }
  const LinkMap& sbetLookup() const { return sbetLookup_; }

  void setAssociations(LinkMap matchingSbet, UnmatchedMap unmatched) {
    LinkMap lookup;
    for (const auto& kv : matchingSbet) lookup[kv.second] = kv.first;
    matchingSbet_ = std::move(matchingSbet);
    sbetLookup_ = std::move(lookup);
    this->replaceUnmatched(std::move(unmatched));
  }

protected:
  void purgeDerived(const std::string& path) override {
    auto it = matchingSbet_.find(path);
    if (it != matchingSbet_.end()) {
      sbetLookup_.erase(it->second);
      matchingSbet_.erase(it);
    }
  }
  void clearDerived() override {
    matchingSbet_.clear();
    sbetLookup_.clear();
  }

private:
  LinkMap matchingSbet_;
  LinkMap sbetLookup_;
};

class NavErrorStore : public SbetLinkedStore<NavErrorRecord> {
public:
  NavErrorStore() : SbetLinkedStore(FileCategory::NavError) {}
};

class NavExportLogStore : public SbetLinkedStore<NavExportLogRecord> {
public:
  NavExportLogStore() : SbetLinkedStore(FileCategory::NavExportLog) {}
};

class SvpStore : public FileRecordStore<SvpRecord> {
public:
  SvpStore() : FileRecordStore(FileCategory::Svp) {}

  const GroupMap& svpGroups() const { return svpGroups_; }
  // one cast file can feed several instances
  const std::map<std::string, std::vector<std::string>>& matchingFqpr() const { return matchingFqpr_; }

  void setAssociations(GroupMap svpGroups,
                       std::map<std::string, std::vector<std::string>> matchingFqpr,
                       UnmatchedMap unmatched);

protected:
  void purgeDerived(const std::string& path) override;
  void clearDerived() override;

private:
  GroupMap svpGroups_;
  std::map<std::string, std::vector<std::string>> matchingFqpr_;
};

} // namespace sdi
