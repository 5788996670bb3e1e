#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/model/fleet_config.hpp"
#include "internal/util/errors.hpp"

namespace fleet::db::sqlite {

using fleet::db::ErrorCode;
using fleet::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw util::Error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kFleetColumns =
    "name,repo_owner,repo_name,labels,worker_group,"
    "min_runners,max_runners,jobs_per_runner,scale_up_threshold,scale_down_threshold,cooldown_seconds,"
    "max_worker_age_seconds,max_rotations_per_tick,replace_unhealthy,scale_down_order,"
    "compute_size,compute_region,compute_image,enabled,created_at_ms,updated_at_ms";

// Binds every column after name starting at first.
void BindFleetFields(sqlite3_stmt* st, int first, const model::FleetRecord& r) {
  int i = first;
  BindText(st, i++, r.repo_owner);
  BindText(st, i++, r.repo_name);
  BindText(st, i++, fleet::model::JoinLabels(r.labels));
  BindText(st, i++, r.worker_group);
  BindI32(st, i++, r.min_runners);
  BindI32(st, i++, r.max_runners);
  BindI32(st, i++, r.jobs_per_runner);
  BindI32(st, i++, r.scale_up_threshold);
  BindI32(st, i++, r.scale_down_threshold);
  BindI64(st, i++, r.cooldown_seconds);
  BindI64(st, i++, r.max_worker_age_seconds);
  BindI32(st, i++, r.max_rotations_per_tick);
  BindI32(st, i++, r.replace_unhealthy ? 1 : 0);
  BindI32(st, i++, r.scale_down_order);
  BindText(st, i++, r.compute_size);
  BindText(st, i++, r.compute_region);
  BindText(st, i++, r.compute_image);
  BindI32(st, i++, r.enabled ? 1 : 0);
  BindU64(st, i++, r.created_at_ms);
  BindU64(st, i++, r.updated_at_ms);
}

model::FleetRecord ReadFleet(sqlite3_stmt* st) {
  model::FleetRecord r;
  int                i      = 0;
  r.name                    = ColText(st, i++);
  r.repo_owner              = ColText(st, i++);
  r.repo_name               = ColText(st, i++);
  r.labels                  = fleet::model::ParseLabels(ColText(st, i++));
  r.worker_group            = ColText(st, i++);
  r.min_runners             = ColI32(st, i++);
  r.max_runners             = ColI32(st, i++);
  r.jobs_per_runner         = ColI32(st, i++);
  r.scale_up_threshold      = ColI32(st, i++);
  r.scale_down_threshold    = ColI32(st, i++);
  r.cooldown_seconds        = ColI64(st, i++);
  r.max_worker_age_seconds  = ColI64(st, i++);
  r.max_rotations_per_tick  = ColI32(st, i++);
  r.replace_unhealthy       = ColI32(st, i++) != 0;
  r.scale_down_order        = ColI32(st, i++);
  r.compute_size            = ColText(st, i++);
  r.compute_region          = ColText(st, i++);
  r.compute_image           = ColText(st, i++);
  r.enabled                 = ColI32(st, i++) != 0;
  r.created_at_ms           = static_cast<uint64_t>(ColI64(st, i++));
  r.updated_at_ms           = static_cast<uint64_t>(ColI64(st, i++));
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS fleets ("
      "name TEXT PRIMARY KEY, repo_owner TEXT NOT NULL, repo_name TEXT NOT NULL, labels TEXT NOT NULL, worker_group TEXT NOT NULL DEFAULT '',"
      "min_runners INTEGER NOT NULL, max_runners INTEGER NOT NULL, jobs_per_runner INTEGER NOT NULL,"
      "scale_up_threshold INTEGER NOT NULL, scale_down_threshold INTEGER NOT NULL, cooldown_seconds INTEGER NOT NULL,"
      "max_worker_age_seconds INTEGER NOT NULL, max_rotations_per_tick INTEGER NOT NULL, replace_unhealthy INTEGER NOT NULL,"
      "scale_down_order INTEGER NOT NULL, compute_size TEXT NOT NULL, compute_region TEXT NOT NULL, compute_image TEXT NOT NULL,"
      "enabled INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS scaling_events ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, fleet TEXT NOT NULL REFERENCES fleets(name) ON DELETE CASCADE,"
      "at_ms INTEGER NOT NULL, action TEXT NOT NULL, current INTEGER NOT NULL, target INTEGER NOT NULL,"
      "reason TEXT NOT NULL, source TEXT NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS scaling_events_fleet ON scaling_events(fleet, id);");

  // fail fast if an older layout is on disk
  db.Exec(std::string("SELECT ") + kFleetColumns + " FROM fleets LIMIT 1;");
  db.Exec("SELECT id,fleet,at_ms,action,current,target,reason,source FROM scaling_events LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Fleets
// ------------------------------------------------------------------

Result SqliteRepository::InsertFleet(Transaction& t, const model::FleetRecord& r) {
  auto* db = TX(t).Handle();

  const auto sql = std::string("INSERT INTO fleets(") + kFleetColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  auto       st  = Prepare(db, sql.c_str());

  BindText(st.get(), 1, r.name);
  BindFleetFields(st.get(), 2, r);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::FleetRecord> SqliteRepository::GetFleet(Transaction& t, const std::string& name) {
  auto*      db  = TX(t).Handle();
  const auto sql = std::string("SELECT ") + kFleetColumns + " FROM fleets WHERE name=?;";
  auto       st  = Prepare(db, sql.c_str());

  BindText(st.get(), 1, name);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw util::Error(std::string("sqlite GetFleet: ") + sqlite3_errmsg(db));
  return ReadFleet(st.get());
}

std::vector<model::FleetRecord> SqliteRepository::ListFleets(Transaction& t) {
  auto*      db  = TX(t).Handle();
  const auto sql = std::string("SELECT ") + kFleetColumns + " FROM fleets ORDER BY name;";
  auto       st  = Prepare(db, sql.c_str());

  std::vector<model::FleetRecord> out;
  int                             rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadFleet(st.get()));
  }
  if (rc != SQLITE_DONE) throw util::Error(std::string("sqlite ListFleets: ") + sqlite3_errmsg(db));
  return out;
}

Result SqliteRepository::UpdateFleet(Transaction& t, const model::FleetRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE fleets SET repo_owner=?,repo_name=?,labels=?,worker_group=?,"
                    "min_runners=?,max_runners=?,jobs_per_runner=?,scale_up_threshold=?,scale_down_threshold=?,cooldown_seconds=?,"
                    "max_worker_age_seconds=?,max_rotations_per_tick=?,replace_unhealthy=?,scale_down_order=?,"
                    "compute_size=?,compute_region=?,compute_image=?,enabled=?,created_at_ms=?,updated_at_ms=? WHERE name=?;");

  BindFleetFields(st.get(), 1, r);
  BindText(st.get(), 21, r.name);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "fleet " + r.name + " not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteFleet(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  // history first, scaling_events references fleets(name)
  auto events = Prepare(db, "DELETE FROM scaling_events WHERE fleet=?;");
  BindText(events.get(), 1, name);
  int rc = sqlite3_step(events.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  auto st = Prepare(db, "DELETE FROM fleets WHERE name=?;");
  BindText(st.get(), 1, name);
  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "fleet " + name + " not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Scaling history
// ------------------------------------------------------------------

Result SqliteRepository::InsertScalingEvent(Transaction& t, model::ScalingEventRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO scaling_events(fleet,at_ms,action,current,target,reason,source) VALUES(?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.fleet);
  BindU64(st.get(), 2, r.at_ms);
  BindText(st.get(), 3, r.action);
  BindI32(st.get(), 4, r.current);
  BindI32(st.get(), 5, r.target);
  BindText(st.get(), 6, r.reason);
  BindText(st.get(), 7, r.source);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::ScalingEventRecord> SqliteRepository::ListScalingEvents(Transaction& t, const std::string& fleet, std::size_t limit) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "SELECT id,fleet,at_ms,action,current,target,reason,source FROM scaling_events "
                    "WHERE fleet=? ORDER BY id DESC LIMIT ?;");
  BindText(st.get(), 1, fleet);
  BindI64(st.get(), 2, static_cast<int64_t>(limit));

  std::vector<model::ScalingEventRecord> out;
  int                                    rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::ScalingEventRecord r;
    r.id      = static_cast<uint64_t>(ColI64(st.get(), 0));
    r.fleet   = ColText(st.get(), 1);
    r.at_ms   = static_cast<uint64_t>(ColI64(st.get(), 2));
    r.action  = ColText(st.get(), 3);
    r.current = ColI32(st.get(), 4);
    r.target  = ColI32(st.get(), 5);
    r.reason  = ColText(st.get(), 6);
    r.source  = ColText(st.get(), 7);
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) throw util::Error(std::string("sqlite ListScalingEvents: ") + sqlite3_errmsg(db));
  return out;
}

} // namespace fleet::db::sqlite
