#pragma once

#include <string_view>

#include "api/fleet/v1.hpp"
#include "service_context.hpp"

namespace fleet::service {

/*
  Operator surface over FleetManager. Transport agnostic: errors propagate as
  util exceptions and are mapped to status codes by the gRPC adapter.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  fleet::v1::EnableFleetResponse    EnableFleet(const fleet::v1::EnableFleetRequest& req);
  fleet::v1::DisableFleetResponse   DisableFleet(const fleet::v1::DisableFleetRequest& req);
  fleet::v1::GetFleetStatusResponse GetFleetStatus(const fleet::v1::GetFleetStatusRequest& req);
  fleet::v1::ListFleetsResponse     ListFleets(const fleet::v1::ListFleetsRequest& req);
  fleet::v1::ScaleFleetResponse     ScaleFleet(const fleet::v1::ScaleFleetRequest& req);
  fleet::v1::UpdateScalingResponse  UpdateScaling(const fleet::v1::UpdateScalingRequest& req);

 private:
  template <class Fn>
  auto Instrumented(std::string_view route, Fn&& fn) -> decltype(fn());

  ServiceContext ctx_;
};

} // namespace fleet::service
