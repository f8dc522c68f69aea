#pragma once

#include "repricer/engine/v1/campaign.pb.h"
#include "repricer/engine/v1/event.pb.h"
#include "repricer/engine/v1/outcome.pb.h"
#include "repricer/engine/v1/state.pb.h"
#include "repricer/engine/v1/variant.pb.h"

#include "repricer/services/v1/commerce_bridge_service.pb.h"
#include "repricer/services/v1/repricer_admin_service.pb.h"
#include "repricer/services/v1/repricer_ingest_service.pb.h"

#include "repricer/services/v1/commerce_bridge_service.grpc.pb.h"
#include "repricer/services/v1/repricer_admin_service.grpc.pb.h"
#include "repricer/services/v1/repricer_ingest_service.grpc.pb.h"

namespace repricer::engine::v1 {
using namespace ::repricer::engine::services::v1;
}
