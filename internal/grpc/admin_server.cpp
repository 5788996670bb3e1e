#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace fleet::grpc {

using namespace fleet::v1;

FleetAdminServer::FleetAdminServer(std::shared_ptr<fleet::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status FleetAdminServer::EnableFleet(::grpc::ServerContext*, const EnableFleetRequest* req, EnableFleetResponse* resp) {
  try {
    *resp = service_->EnableFleet(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetAdminServer::DisableFleet(::grpc::ServerContext*, const DisableFleetRequest* req, DisableFleetResponse* resp) {
  try {
    *resp = service_->DisableFleet(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetAdminServer::GetFleetStatus(::grpc::ServerContext*, const GetFleetStatusRequest* req, GetFleetStatusResponse* resp) {
  try {
    *resp = service_->GetFleetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetAdminServer::ListFleets(::grpc::ServerContext*, const ListFleetsRequest* req, ListFleetsResponse* resp) {
  try {
    *resp = service_->ListFleets(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetAdminServer::ScaleFleet(::grpc::ServerContext*, const ScaleFleetRequest* req, ScaleFleetResponse* resp) {
  try {
    *resp = service_->ScaleFleet(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetAdminServer::UpdateScaling(::grpc::ServerContext*, const UpdateScalingRequest* req, UpdateScalingResponse* resp) {
  try {
    *resp = service_->UpdateScaling(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fleet::grpc
