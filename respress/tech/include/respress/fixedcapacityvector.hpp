#pragma once

#include <amc/fixedcapacityvector.hpp>  // IWYU pragma: export

namespace respress {

using amc::FixedCapacityVector;

}  // namespace respress
