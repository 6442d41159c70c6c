#pragma once
#include <boost/config.hpp>

namespace fractalflake {

// Epochs are unsigned 128-bit millisecond counts.
using uint128_t = boost::uint128_type;

} // namespace fractalflake
