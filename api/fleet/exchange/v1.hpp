#pragma once

#include <google/protobuf/struct.pb.h>

#include "fleet/exchange/v1/exchange.pb.h"
#include "fleet/persist/v1/persist.pb.h"

namespace fleet::exchange::v1 {

// Protocol version stamped on requests and on every queued message.
inline constexpr const char* kApiVersion = "3.2";

} // namespace fleet::exchange::v1
