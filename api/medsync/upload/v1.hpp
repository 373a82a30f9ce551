#pragma once

#include "medsync/upload/v1/transfer.pb.h"

namespace medsync::upload::v1 {

inline constexpr const char* kApiVersion = "v1";

} // namespace medsync::upload::v1
