#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fleet::db::memory {

class MemoryTransaction;

/*
  In-process twin of the SQLite backend. Each transaction works on a private
  copy of the committed state; commit swaps it in and fails if another
  transaction committed first.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertFleet(Transaction&, const model::FleetRecord&) override;
  std::optional<model::FleetRecord> GetFleet(Transaction&, const std::string&) override;
  std::vector<model::FleetRecord>   ListFleets(Transaction&) override;
  Result                            UpdateFleet(Transaction&, const model::FleetRecord&) override;
  Result                            DeleteFleet(Transaction&, const std::string&) override;

  Result                                 InsertScalingEvent(Transaction&, model::ScalingEventRecord&) override;
  std::vector<model::ScalingEventRecord> ListScalingEvents(Transaction&, const std::string& fleet, std::size_t limit) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::FleetRecord> fleets;
    std::vector<model::ScalingEventRecord>    scaling_events;
    uint64_t                                  next_event_id = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace fleet::db::memory
