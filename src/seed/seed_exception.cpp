#include "seed_exception.hpp"
#include <fmt/core.h>
#include <utility>

namespace fractalflake::seed {

network_error::network_error(std::string host, std::uint16_t port, const std::string &reason)
    : sync_exception{fmt::format(R"(Network error while contacting "{}":{} ({}))", host, port, reason)},
      host_{std::move(host)}, port_{port}
{ }


deserialization_error::deserialization_error(const std::string &reason)
    : sync_exception{fmt::format("Invalid json data from server: {}", reason)}
{ }


invalid_sync_epoch_error::invalid_sync_epoch_error(std::string value)
    : sync_exception{fmt::format(R"(Invalid sync epoch received from server: "{}")", value)}, value_{std::move(value)}
{ }

} // namespace fractalflake::seed
