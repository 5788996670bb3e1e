#pragma once

#include "fleet/v1/types.pb.h"

#include "fleet/v1/fleet_admin_service.pb.h"
#include "fleet/v1/fleet_admin_service.grpc.pb.h"
