#pragma once

#include "roster/v1/records.pb.h"

namespace roster::v1 {

inline constexpr const char* kDefaultProgramNamespace = "roster.v1";

}
