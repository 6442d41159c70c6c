#include "flake_seed.hpp"
#include "cfg/kv_reader.hpp"
#include "seed_exception.hpp"
#include "utils/string.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace fractalflake::seed {

namespace {

flake_seed apply(const std::vector<cfg::kv_entry> &entries)
{
    using utils::string::parse_unsigned;

    flake_seed seed;
    for (const auto &[line, key, value]: entries) {
        if (key == "host") {
            seed.sync_host = value;
        } else if (key == "port") {
            const auto port = parse_unsigned<std::uint16_t>(value);
            if (!port)
                throw invalid_port_error(line, value);
            seed.sync_port = *port;
        } else if (key == "node") {
            const auto node = parse_unsigned<std::uint64_t>(value);
            if (!node)
                throw invalid_node_error(line, value);
            seed.node_id = *node;
        } else if (key == "epoch") {
            const auto epoch = parse_unsigned<uint128_t>(value);
            if (!epoch)
                throw invalid_epoch_error(line, value);
            seed.epoch = *epoch;
        }
    }

    return seed;
}


// Extracts the epoch string from {"epoch": "<digits>"}.
std::string extract_epoch(const std::string &body)
{
    using json = nlohmann::json;

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error &e) {
        throw deserialization_error(e.what());
    }

    if (!j.is_object())
        throw deserialization_error("response is not a JSON object");

    const auto it = j.find("epoch");
    if (it == j.end())
        throw deserialization_error(R"(missing "epoch" field)");
    if (!it->is_string())
        throw deserialization_error(fmt::format(R"("epoch" is a {}, not a string)", it->type_name()));

    return it->get<std::string>();
}

} // namespace


flake_seed load(std::istream &in)
{
    return apply(cfg::read_key_values(in));
}


flake_seed load_file(const std::filesystem::path &path)
{
    auto seed = apply(cfg::read_key_values_file(path));
    spdlog::debug("Seed loaded from {} (host={}, port={}, node={}, epoch={})", path.string(), seed.sync_host,
                  seed.sync_port, seed.node_id, seed.epoch);
    return seed;
}


std::string sync_url(const flake_seed &seed)
{
    return fmt::format("http://{}:{}/sync", seed.sync_host, seed.sync_port);
}


void sync(flake_seed &seed, sync_transport &transport)
{
    http::response resp;
    try {
        resp = transport.fetch(sync_url(seed));
    } catch (const http::http_exception &e) {
        throw network_error(seed.sync_host, seed.sync_port, e.what());
    }

    if (resp.status < 200 || resp.status > 299)
        spdlog::warn("Coordinator {}:{} answered with HTTP status {}", seed.sync_host, seed.sync_port, resp.status);

    const std::string value = extract_epoch(resp.body);
    const auto epoch = utils::string::parse_unsigned<uint128_t>(value);
    if (!epoch)
        throw invalid_sync_epoch_error(value);

    seed.epoch = *epoch;
    spdlog::info("Epoch {} received from {}:{}", seed.epoch, seed.sync_host, seed.sync_port);
}


void sync(flake_seed &seed, long timeout)
{
    curl_sync_transport transport(timeout);
    sync(seed, transport);
}


flake::flake_generator seal(const flake_seed &seed, std::uint64_t thread_id, flake::timestamp_mode mode)
{
    return flake::flake_generator(seed.epoch, seed.node_id, thread_id, mode);
}

} // namespace fractalflake::seed
