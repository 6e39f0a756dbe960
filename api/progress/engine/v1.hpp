#pragma once

#include "progress/engine/core/v1/types.pb.h"

#include "progress/engine/reports/v1/reports.pb.h"

#include "progress/engine/services/v1/progress_service.pb.h"
#include "progress/engine/services/v1/template_service.pb.h"

namespace progress::engine::v1 {
using namespace ::progress::engine::core::v1;
using namespace ::progress::engine::reports::v1;
using namespace ::progress::engine::services::v1;
}
