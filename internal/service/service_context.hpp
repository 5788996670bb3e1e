#pragma once

#include <memory>

namespace fleet::core {
class FleetManager;
}

namespace fleet::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fleet::core::FleetManager> manager;
};

} // namespace fleet::service
