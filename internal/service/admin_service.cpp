#include "admin_service.hpp"

#include <chrono>

#include "internal/core/fleet_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/fleet_proto.hpp"
#include "internal/util/errors.hpp"

namespace fleet::service {

using namespace fleet::v1;

namespace {

constexpr std::size_t kDefaultEventLimit = 20;

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager) {
    throw util::InvalidArgument("admin service requires a fleet manager");
  }
}

template <class Fn>
auto AdminService::Instrumented(std::string_view route, Fn&& fn) -> decltype(fn()) {
  fleet::observability::SpanScope span(route);
  const auto                      started_at = std::chrono::steady_clock::now();

  try {
    auto resp = fn();
    fleet::observability::Metrics::Instance().RecordRequest(route, true);
    fleet::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FLEET_LOG_ERROR("RPC failed", {fleet::observability::StringField("route", route), fleet::observability::StringField("error", ex.what())});
    fleet::observability::Metrics::Instance().RecordRequest(route, false);
    fleet::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

EnableFleetResponse AdminService::EnableFleet(const EnableFleetRequest& req) {
  return Instrumented("AdminService.EnableFleet", [&] {
    if (!req.has_spec()) {
      throw util::InvalidArgument("spec is required");
    }
    EnableFleetResponse resp;
    ToProto(ctx_.manager->Enable(FromProto(req.spec())), resp.mutable_status());
    return resp;
  });
}

DisableFleetResponse AdminService::DisableFleet(const DisableFleetRequest& req) {
  return Instrumented("AdminService.DisableFleet", [&] {
    DisableFleetResponse resp;
    resp.set_drained_workers(ctx_.manager->Disable(req.name(), req.drain()));
    return resp;
  });
}

GetFleetStatusResponse AdminService::GetFleetStatus(const GetFleetStatusRequest& req) {
  return Instrumented("AdminService.GetFleetStatus", [&] {
    GetFleetStatusResponse resp;
    auto*                  status = resp.mutable_status();
    ToProto(ctx_.manager->Status(req.name()), status);

    const std::size_t limit = req.event_limit() > 0 ? req.event_limit() : kDefaultEventLimit;
    status->clear_recent_events();
    for (const auto& event : ctx_.manager->RecentEvents(req.name(), limit)) {
      ToProto(event, status->add_recent_events());
    }
    return resp;
  });
}

ListFleetsResponse AdminService::ListFleets(const ListFleetsRequest&) {
  return Instrumented("AdminService.ListFleets", [&] {
    ListFleetsResponse resp;
    for (const auto& snapshot : ctx_.manager->List()) {
      auto* status = resp.add_fleets();
      ToProto(snapshot, status);
      // summaries only
      status->clear_recent_events();
    }
    return resp;
  });
}

ScaleFleetResponse AdminService::ScaleFleet(const ScaleFleetRequest& req) {
  return Instrumented("AdminService.ScaleFleet", [&] {
    ScaleFleetResponse resp;
    ToProto(ctx_.manager->Scale(req.name(), req.count()), resp.mutable_decision());
    return resp;
  });
}

UpdateScalingResponse AdminService::UpdateScaling(const UpdateScalingRequest& req) {
  return Instrumented("AdminService.UpdateScaling", [&] {
    const auto current = ctx_.manager->Status(req.name()).definition.scaling;

    UpdateScalingResponse resp;
    ToProto(ctx_.manager->UpdateScaling(req.name(), FromProto(req.scaling(), current)), resp.mutable_status());
    return resp;
  });
}

} // namespace fleet::service
