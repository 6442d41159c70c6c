#pragma once

namespace fractalflake::cfg {
struct settings;
}

namespace fractalflake::logging {

// Initialize spdlog from the configuration settings
void init_spdlog(const cfg::settings &settings);

} // namespace fractalflake::logging
