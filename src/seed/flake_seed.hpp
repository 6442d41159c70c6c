#pragma once
#include "flake/flake_generator.hpp"
#include "sync_transport.hpp"
#include "utils/uint128.hpp"
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>

namespace fractalflake::seed {

// Everything a node needs to start issuing identifiers. Zero values mean
// "not configured".
struct flake_seed {
    std::string sync_host;
    std::uint16_t sync_port = 0;
    std::uint64_t node_id = 0;
    uint128_t epoch = 0;
};


// Reads host, port, node and epoch from key=value lines. Other keys are
// ignored and later duplicates win.
// Throws cfg::missing_equals_error, invalid_port_error, invalid_node_error or
// invalid_epoch_error.
flake_seed load(std::istream &in);

// As above; additionally throws cfg::config_io_error.
flake_seed load_file(const std::filesystem::path &path);

// http://<host>:<port>/sync
std::string sync_url(const flake_seed &seed);

// Replaces seed.epoch with the one served by the coordinator. The seed is
// left untouched on failure.
// Throws network_error, deserialization_error or invalid_sync_epoch_error.
void sync(flake_seed &seed, sync_transport &transport);

// sync() over libcurl; timeout in seconds, -1 for libcurl's default.
void sync(flake_seed &seed, long timeout = -1);

// Binds the seed to a worker. Every concurrent worker needs its own generator
// and its own thread id.
flake::flake_generator seal(const flake_seed &seed, std::uint64_t thread_id,
                            flake::timestamp_mode mode = flake::timestamp_mode::unix_time);

} // namespace fractalflake::seed
