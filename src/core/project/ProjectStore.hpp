#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "core/project/CatalogInstance.hpp"

namespace sdi {

// SQLite persistence for the project's containers (see schema.sql).
class ProjectStore {
public:
  // Creates the database (and its directory) if needed, applies the schema
  // file and stamps the schema version. Safe to call on every start.
  static void ensureSchema(const std::string& dbPath, const std::string& schemaPath);

  explicit ProjectStore(const std::string& dbPath);
  ~ProjectStore();
  ProjectStore(const ProjectStore&) = delete;
  ProjectStore& operator=(const ProjectStore&) = delete;

  // Writes the instance row and replaces its imported files and casts in one
  // transaction.
  void upsertInstance(const InstanceRecord& r);
  std::vector<InstanceRecord> loadInstances() const;
  void appendHistory(const std::string& instance_key,
                     const std::string& event,
                     const std::string& details_json,
                     int64_t at,
                     const std::string& actor);

private:
  void* db_; // sqlite3*
};

} // namespace sdi
