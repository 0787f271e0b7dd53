#pragma once
#include "core/records/CategoryStores.hpp"

namespace sdi {

// Association maps as of the last regeneration. Compared against freshly
// matched maps to decide which action families need rebuilding.
struct Snapshot {
  GroupMap lineGroups;
  GroupMap navGroups;
  LinkMap  navErrorMatches;
  LinkMap  navLogMatches;
  GroupMap svpGroups;

  bool sameMultibeam(const Snapshot& o) const { return lineGroups == o.lineGroups; }
  bool sameNavigation(const Snapshot& o) const {
    return navGroups == o.navGroups && navErrorMatches == o.navErrorMatches && navLogMatches == o.navLogMatches;
  }
  bool sameSvp(const Snapshot& o) const { return svpGroups == o.svpGroups; }
};

} // namespace sdi
