#pragma once
#include <cstdint>
#include <memory>

namespace fractalflake::flake {

// Source of wall-clock time in milliseconds since the Unix epoch.
class clock_source {
public:
    virtual ~clock_source() = default;

    virtual std::uint64_t now_ms() = 0;
};


// std::chrono::system_clock backed source.
// A reading earlier than the one taken at construction means the system clock
// was set back; identifier ordering can no longer be guaranteed and the
// process is aborted.
class system_clock_source final : public clock_source {
public:
    system_clock_source();

    std::uint64_t now_ms() override;

private:
    static std::int64_t read();

private:
    std::int64_t start_ms_;
};


// Process-wide system clock, created on first use.
std::shared_ptr<clock_source> default_clock();

} // namespace fractalflake::flake
