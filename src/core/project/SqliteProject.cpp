#include "SqliteProject.hpp"
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/common/TimeUtil.hpp"

namespace sdi {

SqliteProject::SqliteProject(const std::string& dbPath) : store_(dbPath) {
  for (auto& r : store_.loadInstances()) {
    const std::string key = r.key;
    instances_[key] = std::make_shared<CatalogInstance>(std::move(r));
  }
  spdlog::info("Project {} opened with {} containers", dbPath, instances_.size());
}

void SqliteProject::storeInstance(const std::string& key, const InstanceHandle& instance) {
  if (!instance) throw std::invalid_argument("cannot store an empty instance handle for " + key);
  InstanceRecord r = toInstanceRecord(key, *instance);
  const int64_t now = timeutil::nowUtc();
  const bool isNew = instances_.count(key) == 0;
  if (r.createdAt == 0) r.createdAt = now;
  r.updatedAt = now;
  store_.upsertInstance(r);
  store_.appendHistory(key, isNew ? "CREATED" : "UPDATED",
                       nlohmann::json({{"next_step", toString(r.nextStep)},
                                       {"lines", r.multibeamFiles.size()}}).dump(),
                       now, "intelligence");
  instances_[key] = std::make_shared<CatalogInstance>(std::move(r));
}

} // namespace sdi
