#pragma once

#include <cstddef>
#include <vector>

#include "api/fleet/v1.hpp"
#include "internal/controller/fleet_snapshot.hpp"
#include "internal/model/fleet_config.hpp"
#include "internal/model/scaling_decision.hpp"

namespace fleet::service {

/*
  Conversions between the fleet.v1 wire types and the domain model.
  Unset optional scaling / rotation fields resolve against base.
*/
model::FleetDefinition FromProto(const fleet::v1::FleetSpec& spec);
model::ScalingConfig   FromProto(const fleet::v1::ScalingSpec& spec, const model::ScalingConfig& base = {});

void ToProto(const model::FleetDefinition& definition, fleet::v1::FleetSpec* out);
void ToProto(const model::ScalingConfig& scaling, fleet::v1::ScalingSpec* out);
void ToProto(const model::ScalingDecision& decision, fleet::v1::ScalingDecision* out);
void ToProto(const controller::ScalingEvent& event, fleet::v1::ScalingEvent* out);
void ToProto(const controller::FleetSnapshot& snapshot, fleet::v1::FleetStatus* out);

fleet::v1::ScalingAction ToProto(model::ScalingAction action);
fleet::v1::WorkerState   ToProto(model::WorkerState state);

} // namespace fleet::service
