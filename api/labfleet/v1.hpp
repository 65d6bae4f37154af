#pragma once

#include "labfleet/fleet/v1/fleet.pb.h"

namespace labfleet::v1 {
using namespace ::labfleet::fleet::v1;
}
