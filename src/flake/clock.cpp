#include "clock.hpp"
#include <chrono>
#include <cstdlib>
#include <memory>
#include <spdlog/spdlog.h>

namespace fractalflake::flake {

system_clock_source::system_clock_source()
    : start_ms_{read()}
{ }


std::uint64_t system_clock_source::now_ms()
{
    const std::int64_t now = read();
    if (now < start_ms_) {
        spdlog::critical("System clock went backwards ({} ms < {} ms at start); aborting", now, start_ms_);
        std::abort();
    }

    return static_cast<std::uint64_t>(now);
}


std::int64_t system_clock_source::read()
{
    using namespace std::chrono;

    const auto now = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    if (now < 0) {
        spdlog::critical("System clock reads before the Unix epoch ({} ms); aborting", now);
        std::abort();
    }

    return now;
}


std::shared_ptr<clock_source> default_clock()
{
    static const std::shared_ptr<clock_source> clock = std::make_shared<system_clock_source>();
    return clock;
}

} // namespace fractalflake::flake
