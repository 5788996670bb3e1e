#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fleet::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the fleets / scaling_events tables when missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertFleet(Transaction&, const model::FleetRecord&) override;
  std::optional<model::FleetRecord> GetFleet(Transaction&, const std::string&) override;
  std::vector<model::FleetRecord>   ListFleets(Transaction&) override;
  Result                            UpdateFleet(Transaction&, const model::FleetRecord&) override;
  Result                            DeleteFleet(Transaction&, const std::string&) override;

  Result                                 InsertScalingEvent(Transaction&, model::ScalingEventRecord&) override;
  std::vector<model::ScalingEventRecord> ListScalingEvents(Transaction&, const std::string& fleet, std::size_t limit) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace fleet::db::sqlite
