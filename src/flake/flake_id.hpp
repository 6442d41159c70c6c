#pragma once
#include <cstdint>
#include <string>

namespace fractalflake::flake {

// Identifier layout, most significant bits first:
//
//   [42 bits timestamp][5 bits node][5 bits thread][12 bits sequence]
//
inline constexpr unsigned TIMESTAMP_BITS = 42;
inline constexpr unsigned NODE_ID_BITS = 5;
inline constexpr unsigned THREAD_ID_BITS = 5;
inline constexpr unsigned SEQUENCE_BITS = 12;

inline constexpr unsigned THREAD_ID_SHIFT = SEQUENCE_BITS;
inline constexpr unsigned NODE_ID_SHIFT = THREAD_ID_SHIFT + THREAD_ID_BITS;
inline constexpr unsigned TIMESTAMP_SHIFT = NODE_ID_SHIFT + NODE_ID_BITS;

inline constexpr std::uint64_t TIMESTAMP_MASK = (std::uint64_t{1} << TIMESTAMP_BITS) - 1;
inline constexpr std::uint64_t NODE_ID_MASK = (std::uint64_t{1} << NODE_ID_BITS) - 1;
inline constexpr std::uint64_t THREAD_ID_MASK = (std::uint64_t{1} << THREAD_ID_BITS) - 1;
inline constexpr std::uint64_t SEQUENCE_MASK = (std::uint64_t{1} << SEQUENCE_BITS) - 1;

// Number of generators a node can run without their identifiers colliding.
inline constexpr std::uint64_t MAX_THREADS = THREAD_ID_MASK + 1;

// True when thread ids first_thread .. first_thread + count - 1 all keep
// distinct bits in the thread field.
constexpr bool thread_ids_fit(std::uint64_t first_thread, std::uint64_t count)
{
    return count <= MAX_THREADS && first_thread <= MAX_THREADS - count;
}

// Decoded view of an identifier. Each field holds only its significant bits.
struct flake_fields {
    std::uint64_t timestamp = 0;
    std::uint64_t node_id = 0;
    std::uint64_t thread_id = 0;
    std::uint64_t sequence = 0;
};

// Packs the fields into an identifier; every field is masked to its width.
constexpr std::uint64_t compose(const flake_fields &fields)
{
    return ((fields.timestamp & TIMESTAMP_MASK) << TIMESTAMP_SHIFT) | ((fields.node_id & NODE_ID_MASK) << NODE_ID_SHIFT) |
           ((fields.thread_id & THREAD_ID_MASK) << THREAD_ID_SHIFT) | (fields.sequence & SEQUENCE_MASK);
}

constexpr flake_fields decompose(std::uint64_t id)
{
    flake_fields fields;
    fields.timestamp = (id >> TIMESTAMP_SHIFT) & TIMESTAMP_MASK;
    fields.node_id = (id >> NODE_ID_SHIFT) & NODE_ID_MASK;
    fields.thread_id = (id >> THREAD_ID_SHIFT) & THREAD_ID_MASK;
    fields.sequence = id & SEQUENCE_MASK;
    return fields;
}

bool operator==(const flake_fields &lhs, const flake_fields &rhs);
bool operator!=(const flake_fields &lhs, const flake_fields &rhs);

// "timestamp=... node=... thread=... sequence=..."
std::string to_string(const flake_fields &fields);

} // namespace fractalflake::flake
