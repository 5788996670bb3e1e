#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace fleet::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertFleet(Transaction& t, const model::FleetRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.fleets.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "fleet " + r.name + " exists");
  s.fleets[r.name] = r;
  return Result::Ok();
}

std::optional<model::FleetRecord> MemoryRepository::GetFleet(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.fleets.find(name);
  if (it == s.fleets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FleetRecord> MemoryRepository::ListFleets(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::FleetRecord> records;
  records.reserve(s.fleets.size());
  for (const auto& [_, record] : s.fleets) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateFleet(Transaction& t, const model::FleetRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.fleets.contains(r.name)) return Result::Err(ErrorCode::NotFound, "fleet " + r.name + " not found");
  s.fleets[r.name] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteFleet(Transaction& t, const std::string& name) {
  auto& s = TX(t).Mutable();
  if (s.fleets.erase(name) == 0) return Result::Err(ErrorCode::NotFound, "fleet " + name + " not found");
  std::erase_if(s.scaling_events, [&](const model::ScalingEventRecord& e) { return e.fleet == name; });
  return Result::Ok();
}

Result MemoryRepository::InsertScalingEvent(Transaction& t, model::ScalingEventRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.fleets.contains(r.fleet)) return Result::Err(ErrorCode::ConstraintViolation, "fleet " + r.fleet + " not found");
  r.id = s.next_event_id++;
  s.scaling_events.push_back(r);
  return Result::Ok();
}

std::vector<model::ScalingEventRecord> MemoryRepository::ListScalingEvents(Transaction& t, const std::string& fleet, std::size_t limit) {
  std::vector<model::ScalingEventRecord> out;
  const auto&                            events = TX(t).View().scaling_events;
  for (auto it = events.rbegin(); it != events.rend() && out.size() < limit; ++it) {
    if (it->fleet == fleet) out.push_back(*it);
  }
  return out;
}

} // namespace fleet::db::memory
