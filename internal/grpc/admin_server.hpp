#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fleet/v1/fleet_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace fleet::grpc {

class FleetAdminServer final : public fleet::v1::FleetAdminService::Service {
 public:
  explicit FleetAdminServer(std::shared_ptr<fleet::service::AdminService> svc);

  ::grpc::Status EnableFleet(::grpc::ServerContext*, const fleet::v1::EnableFleetRequest*, fleet::v1::EnableFleetResponse*) override;
  ::grpc::Status DisableFleet(::grpc::ServerContext*, const fleet::v1::DisableFleetRequest*, fleet::v1::DisableFleetResponse*) override;
  ::grpc::Status GetFleetStatus(::grpc::ServerContext*, const fleet::v1::GetFleetStatusRequest*,
                                fleet::v1::GetFleetStatusResponse*) override;
  ::grpc::Status ListFleets(::grpc::ServerContext*, const fleet::v1::ListFleetsRequest*, fleet::v1::ListFleetsResponse*) override;
  ::grpc::Status ScaleFleet(::grpc::ServerContext*, const fleet::v1::ScaleFleetRequest*, fleet::v1::ScaleFleetResponse*) override;
  ::grpc::Status UpdateScaling(::grpc::ServerContext*, const fleet::v1::UpdateScalingRequest*, fleet::v1::UpdateScalingResponse*) override;

 private:
  std::shared_ptr<fleet::service::AdminService> service_;
};

} // namespace fleet::grpc
