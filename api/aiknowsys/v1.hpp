#pragma once

#include "aiknowsys/context/v1/context.pb.h"
#include "aiknowsys/learning/v1/patterns.pb.h"

namespace aiknowsys::v1 {
using namespace ::aiknowsys::context::v1;
using namespace ::aiknowsys::learning::v1;
}
