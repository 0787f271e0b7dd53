#pragma once
#include <string>

#include "core/project/Project.hpp"
#include "core/project/ProjectStore.hpp"

namespace sdi {

// Project backed by ProjectStore. Instances are loaded once on open and kept
// in memory; storeInstance writes through.
class SqliteProject : public Project {
public:
  explicit SqliteProject(const std::string& dbPath);

  InstanceMap instances() const override { return instances_; }
  void storeInstance(const std::string& key, const InstanceHandle& instance) override;

private:
  ProjectStore store_;
  InstanceMap instances_;
};

} // namespace sdi
