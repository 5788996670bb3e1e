#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/fleet_record.hpp"
#include "internal/db/model/scaling_event_record.hpp"

namespace fleet::db {

/*
  Repository abstraction.

  GUARANTEES:
  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a fleet deletes its scaling history

  The DB is the source of truth for:
    fleet definitions (restored at startup)
    scaling event history
*/
class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Fleets
  // ---------------------------------------------------------------------
  virtual Result                            InsertFleet(Transaction&, const model::FleetRecord&) = 0;
  virtual std::optional<model::FleetRecord> GetFleet(Transaction&, const std::string& name) = 0;
  // Ordered by name.
  virtual std::vector<model::FleetRecord> ListFleets(Transaction&) = 0;
  virtual Result                          UpdateFleet(Transaction&, const model::FleetRecord&) = 0;
  virtual Result                          DeleteFleet(Transaction&, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Scaling history
  // ---------------------------------------------------------------------
  // Assigns record.id.
  virtual Result InsertScalingEvent(Transaction&, model::ScalingEventRecord& record) = 0;
  // Newest first, at most limit entries.
  virtual std::vector<model::ScalingEventRecord> ListScalingEvents(Transaction&, const std::string& fleet, std::size_t limit) = 0;
};

} // namespace fleet::db
