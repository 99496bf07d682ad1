#pragma once

#include "trackmatch/core/v1/types.pb.h"

#include "trackmatch/services/v1/match_service.pb.h"
#include "trackmatch/services/v1/match_service.grpc.pb.h"

namespace trackmatch::v1 {
using namespace ::trackmatch::core::v1;
using namespace ::trackmatch::services::v1;
}
