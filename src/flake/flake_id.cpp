#include "flake_id.hpp"
#include <fmt/core.h>
#include <string>

namespace fractalflake::flake {

bool operator==(const flake_fields &lhs, const flake_fields &rhs)
{
    return lhs.timestamp == rhs.timestamp && lhs.node_id == rhs.node_id && lhs.thread_id == rhs.thread_id &&
           lhs.sequence == rhs.sequence;
}


bool operator!=(const flake_fields &lhs, const flake_fields &rhs)
{
    return !(lhs == rhs);
}


std::string to_string(const flake_fields &fields)
{
    return fmt::format("timestamp={} node={} thread={} sequence={}", fields.timestamp, fields.node_id,
                       fields.thread_id, fields.sequence);
}

} // namespace fractalflake::flake
