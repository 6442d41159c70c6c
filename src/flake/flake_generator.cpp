#include "flake_generator.hpp"
#include "flake_id.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fractalflake::flake {

flake_generator::flake_generator(uint128_t epoch, std::uint64_t node_id, std::uint64_t thread_id,
                                 timestamp_mode mode, std::shared_ptr<clock_source> clock)
    : epoch_{epoch}, node_id_{node_id}, thread_id_{thread_id}, mode_{mode}, clock_{std::move(clock)}, sequence_{0},
      last_time_{0}
{
    if (clock_ == nullptr)
        throw std::invalid_argument("flake_generator requires a clock");

    if (mode_ == timestamp_mode::since_epoch) {
        const std::uint64_t now = clock_->now_ms();
        if (epoch_ > now)
            throw std::invalid_argument(fmt::format("Flake epoch {} is in the future (now {})", epoch_, now));
    }

    // out of range ids alias onto other nodes/threads
    if (node_id_ > NODE_ID_MASK)
        spdlog::warn("Node id {} does not fit in {} bits; using {}", node_id_, NODE_ID_BITS, node_id_ & NODE_ID_MASK);
    if (thread_id_ > THREAD_ID_MASK)
        spdlog::warn("Thread id {} does not fit in {} bits; using {}", thread_id_, THREAD_ID_BITS,
                     thread_id_ & THREAD_ID_MASK);

    spdlog::debug("Flake generator sealed (epoch={}, node={}, thread={})", epoch_, node_id_, thread_id_);
}


std::uint64_t flake_generator::generate()
{
    last_time_ = next_millis();

    flake_fields fields;
    fields.timestamp = timestamp_field();
    fields.node_id = node_id_;
    fields.thread_id = thread_id_;
    fields.sequence = sequence_;
    const std::uint64_t id = compose(fields);

    ++sequence_;

    return id;
}


std::uint64_t flake_generator::next_millis()
{
    // every sequence value of last_time_ is spent
    if (sequence_ > SEQUENCE_MASK) {
        const std::uint64_t now = wait_next_millis();
        sequence_ = 0;
        return now;
    }

    const std::uint64_t now = clock_->now_ms();
    if (now > last_time_) {
        sequence_ = 0;
        return now;
    }

    // Same millisecond. A clock that stepped back below last_time_ is also
    // counted against last_time_ so identifiers never decrease.
    return last_time_;
}


std::uint64_t flake_generator::wait_next_millis() const
{
    spdlog::trace("Sequence exhausted at {} ms (node={}, thread={}); waiting for the next millisecond", last_time_,
                  node_id_, thread_id_);

    std::uint64_t now = clock_->now_ms();
    while (now <= last_time_) {
        std::this_thread::sleep_for(ROLLOVER_POLL_INTERVAL);
        now = clock_->now_ms();
    }

    return now;
}


std::uint64_t flake_generator::timestamp_field() const
{
    if (mode_ == timestamp_mode::unix_time)
        return last_time_;

    if (last_time_ < epoch_) {
        spdlog::critical("Clock reads {} ms, before the flake epoch {}; aborting", last_time_, epoch_);
        std::abort();
    }

    return static_cast<std::uint64_t>(last_time_ - epoch_);
}

} // namespace fractalflake::flake
