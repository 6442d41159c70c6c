#pragma once
#include "clock.hpp"
#include "utils/uint128.hpp"
#include <chrono>
#include <cstdint>
#include <memory>

namespace fractalflake::flake {

// What goes into the 42-bit timestamp field.
enum class timestamp_mode {
    // raw milliseconds since the Unix epoch; the configured epoch is carried but not subtracted
    unix_time,
    // milliseconds elapsed since the configured epoch
    since_epoch
};


// Issues identifiers for one (node, thread) pair.
//
// An instance must be owned by a single worker: generate() reads and updates
// the sequence and last_time state without synchronization. Run one instance
// per concurrent worker, each with its own thread id.
//
// At most 4096 identifiers are issued per millisecond. The call that would
// exceed that waits until the clock moves to a later millisecond.
class flake_generator {
public:
    flake_generator(uint128_t epoch, std::uint64_t node_id, std::uint64_t thread_id,
                    timestamp_mode mode = timestamp_mode::unix_time,
                    std::shared_ptr<clock_source> clock = default_clock());

    flake_generator(const flake_generator &) = delete;
    flake_generator &operator=(const flake_generator &) = delete;
    flake_generator(flake_generator &&) = default;
    flake_generator &operator=(flake_generator &&) = default;

    std::uint64_t generate();

    uint128_t epoch() const { return epoch_; }
    std::uint64_t node_id() const { return node_id_; }
    std::uint64_t thread_id() const { return thread_id_; }
    timestamp_mode mode() const { return mode_; }

    // sequence value the next identifier would carry, before any reset
    std::uint64_t sequence() const { return sequence_; }
    // millisecond of the most recent identifier, 0 before the first one
    std::uint64_t last_time() const { return last_time_; }

private:
    std::uint64_t next_millis();
    std::uint64_t wait_next_millis() const;
    std::uint64_t timestamp_field() const;

private:
    static constexpr std::chrono::microseconds ROLLOVER_POLL_INTERVAL{50};

    uint128_t epoch_;
    std::uint64_t node_id_;
    std::uint64_t thread_id_;
    timestamp_mode mode_;
    std::shared_ptr<clock_source> clock_;

    std::uint64_t sequence_;
    std::uint64_t last_time_;
};

} // namespace fractalflake::flake
