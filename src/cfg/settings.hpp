#pragma once
#include <filesystem>
#include <istream>
#include <string>

namespace fractalflake::cfg {

// Options of the configuration file that are not part of the flake seed.
struct settings {
    std::string log_type = "console";
    std::string log_priority = "info";
    std::string log_facility = "user";
    // seconds; -1 keeps libcurl's default
    long sync_timeout = -1;

    // Throws cfg_exception naming the offending option.
    void validate() const;
};

// Picks the settings keys out of a key=value source and validates them.
// Seed keys and unknown keys are ignored.
settings load_settings(std::istream &in);
settings load_settings_file(const std::filesystem::path &path);

} // namespace fractalflake::cfg
