#pragma once
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace fractalflake::cfg {

struct kv_entry {
    std::size_t line; // 1-based
    std::string key;
    std::string value;
};

// Splits "key=value" lines at the first '='. Lines, keys and values are
// trimmed; lines that are empty after trimming are skipped. Entries come back
// in file order, so a consumer applying them in turn lets later duplicates win.
// Throws missing_equals_error for a line without '='.
std::vector<kv_entry> read_key_values(std::istream &in);

// As above, reading the file at `path`. Throws config_io_error if it cannot be read.
std::vector<kv_entry> read_key_values_file(const std::filesystem::path &path);

} // namespace fractalflake::cfg
