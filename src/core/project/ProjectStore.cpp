#include "ProjectStore.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <sqlite3.h>

#include <spdlog/spdlog.h>

namespace sdi {

namespace {

constexpr int kSchemaVersion = 1;

// closes on scope exit
struct Connection {
  sqlite3* db = nullptr;
  Connection(const std::string& path, int flags) {
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
      std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
      sqlite3_close(db);
      throw std::runtime_error("failed to open db " + path + ": " + msg);
    }
  }
  ~Connection() { sqlite3_close(db); }
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
};

// finalizes on scope exit
struct Statement {
  sqlite3_stmt* st = nullptr;
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(st); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
};

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

void stepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
}

std::string columnText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : std::string();
}

void insertFiles(sqlite3* db, const std::string& key, const char* category, const std::vector<std::string>& names) {
  for (const auto& name : names) {
    Statement s(db, "INSERT OR IGNORE INTO imported_files (instance_key, category, file_name) VALUES (?,?,?)");
    sqlite3_bind_text(s.st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 2, category, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s.st, 3, name.c_str(), -1, SQLITE_TRANSIENT);
    stepDone(db, s.st, "insert imported file");
  }
}

} // namespace

void ProjectStore::ensureSchema(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  std::ifstream in(schemaPath);
  if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
  std::ostringstream schema;
  schema << in.rdbuf();

  Connection c(dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX);
  exec(c.db, "PRAGMA journal_mode=WAL;");
  exec(c.db, "PRAGMA synchronous=NORMAL;");
  exec(c.db, "PRAGMA foreign_keys=ON;");
  exec(c.db, "PRAGMA busy_timeout=5000;");

  int version = 0;
  {
    Statement s(c.db, "PRAGMA user_version;");
    if (sqlite3_step(s.st) == SQLITE_ROW) version = sqlite3_column_int(s.st, 0);
  }
  if (version > kSchemaVersion) {
    throw std::runtime_error("project " + dbPath + " has schema version " + std::to_string(version) +
                             ", newer than this build supports (" + std::to_string(kSchemaVersion) + ")");
  }
  // the schema is idempotent, reapply it so added tables and indexes appear
  exec(c.db, schema.str().c_str());
  exec(c.db, ("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";").c_str());
  spdlog::info("Project schema v{} ready at {}", kSchemaVersion, dbPath);
}

ProjectStore::ProjectStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + dbPath);
  }
  db_ = db;
  exec(db, "PRAGMA foreign_keys=ON;");
}

ProjectStore::~ProjectStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void ProjectStore::upsertInstance(const InstanceRecord& r) {
  auto* db = static_cast<sqlite3*>(db_);
  exec(db, "BEGIN IMMEDIATE;");
  try {
    {
      const char* sql = R"SQL(
        INSERT INTO instances
          (key, model, primary_serial, secondary_serial, data_start_utc, next_step, created_at, updated_at)
        VALUES (?,?,?,?,?,?,?,?)
        ON CONFLICT(key) DO UPDATE SET
          model=excluded.model, primary_serial=excluded.primary_serial,
          secondary_serial=excluded.secondary_serial, data_start_utc=excluded.data_start_utc,
          next_step=excluded.next_step, updated_at=excluded.updated_at
      )SQL";
      Statement s(db, sql);
      int i = 1;
      sqlite3_bind_text(s.st, i++, r.key.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_text(s.st, i++, r.model.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int(s.st, i++, r.primarySerial);
      sqlite3_bind_int(s.st, i++, r.secondarySerial);
      sqlite3_bind_double(s.st, i++, r.dataStartUtc);
      sqlite3_bind_text(s.st, i++, toString(r.nextStep), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int64(s.st, i++, r.createdAt);
      sqlite3_bind_int64(s.st, i++, r.updatedAt);
      stepDone(db, s.st, "upsertInstance");
    }
    {
      Statement s(db, "DELETE FROM imported_files WHERE instance_key = ?");
      sqlite3_bind_text(s.st, 1, r.key.c_str(), -1, SQLITE_TRANSIENT);
      stepDone(db, s.st, "clear imported files");
    }
    {
      Statement s(db, "DELETE FROM casts WHERE instance_key = ?");
      sqlite3_bind_text(s.st, 1, r.key.c_str(), -1, SQLITE_TRANSIENT);
      stepDone(db, s.st, "clear casts");
    }
    insertFiles(db, r.key, toString(FileCategory::Multibeam), r.multibeamFiles);
    insertFiles(db, r.key, toString(FileCategory::Navigation), r.navigationFiles);
    insertFiles(db, r.key, toString(FileCategory::Svp), r.svpFiles);
    for (double t : r.castTimes) {
      Statement s(db, "INSERT OR IGNORE INTO casts (instance_key, cast_time) VALUES (?,?)");
      sqlite3_bind_text(s.st, 1, r.key.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_double(s.st, 2, t);
      stepDone(db, s.st, "insert cast");
    }
    exec(db, "COMMIT;");
  } catch (...) {
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

std::vector<InstanceRecord> ProjectStore::loadInstances() const {
  auto* db = static_cast<sqlite3*>(db_);
  std::vector<InstanceRecord> out;
  std::map<std::string, std::size_t> index;
  {
    Statement s(db, R"SQL(
      SELECT key, model, primary_serial, secondary_serial, data_start_utc, next_step, created_at, updated_at
      FROM instances ORDER BY key
    )SQL");
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
      InstanceRecord r;
      r.key = columnText(s.st, 0);
      r.model = columnText(s.st, 1);
      r.primarySerial = sqlite3_column_int(s.st, 2);
      r.secondarySerial = sqlite3_column_int(s.st, 3);
      r.dataStartUtc = sqlite3_column_double(s.st, 4);
      const std::string step = columnText(s.st, 5);
      auto parsed = processingStepFromString(step);
      if (!parsed) throw std::runtime_error("instance " + r.key + " has unknown processing step " + step);
      r.nextStep = *parsed;
      r.createdAt = sqlite3_column_int64(s.st, 6);
      r.updatedAt = sqlite3_column_int64(s.st, 7);
      index[r.key] = out.size();
      out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("loadInstances failed: ") + sqlite3_errmsg(db));
  }
  {
    Statement s(db, "SELECT instance_key, category, file_name FROM imported_files ORDER BY rowid");
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
      auto it = index.find(columnText(s.st, 0));
      if (it == index.end()) continue;
      auto& r = out[it->second];
      const std::string category = columnText(s.st, 1);
      const std::string name = columnText(s.st, 2);
      if (category == toString(FileCategory::Multibeam)) r.multibeamFiles.push_back(name);
      else if (category == toString(FileCategory::Navigation)) r.navigationFiles.push_back(name);
      else if (category == toString(FileCategory::Svp)) r.svpFiles.push_back(name);
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("load imported files failed: ") + sqlite3_errmsg(db));
  }
  {
    Statement s(db, "SELECT instance_key, cast_time FROM casts ORDER BY cast_time");
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
      auto it = index.find(columnText(s.st, 0));
      if (it != index.end()) out[it->second].castTimes.push_back(sqlite3_column_double(s.st, 1));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("load casts failed: ") + sqlite3_errmsg(db));
  }
  return out;
}

void ProjectStore::appendHistory(const std::string& instance_key,
                                 const std::string& event,
                                 const std::string& details_json,
                                 int64_t at,
                                 const std::string& actor) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO instance_history (instance_key, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL";
  Statement s(db, sql);
  sqlite3_bind_text(s.st, 1, instance_key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 2, event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 3, details_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, 4, at);
  sqlite3_bind_text(s.st, 5, actor.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, s.st, "appendHistory");
}

} // namespace sdi
