#pragma once
#include <string>

#include "core/config/Settings.hpp"
#include "core/project/Project.hpp"
#include "core/records/CategoryStores.hpp"

namespace sdi {

// Synthesized folder name for lines with no container yet,
// "<model>_<primary serial>_<MM>_<DD>_<YYYY>".
std::string newContainerName(const MultibeamRecord& r);

/*
  Rebuilds the association maps between stores and against the project.

  Every pass computes its maps from scratch over the current rows and hands
  them to the store in one call, so an exception thrown mid pass (from the
  project, typically) leaves the previous maps in place. Each unmatched file
  gets a reason string describing the rule it failed.
*/
class CrossMatcher {
public:
  explicit CrossMatcher(MatchSettings settings = {}) : settings_(settings) {}

  void matchNavErrorToNav(NavErrorStore& errors, const NavigationStore& nav) const;
  void matchExportLogToNav(NavExportLogStore& logs, const NavigationStore& nav) const;

  // project may be null (no project open)
  void matchMultibeamToProject(MultibeamStore& mbes, const Project* project) const;
  void matchNavToProject(NavigationStore& nav,
                         const NavErrorStore& errors,
                         const NavExportLogStore& logs,
                         const Project* project) const;
  void matchSvpToProject(SvpStore& svp, const Project* project) const;

  const MatchSettings& settings() const { return settings_; }

private:
  MatchSettings settings_;
};

} // namespace sdi
