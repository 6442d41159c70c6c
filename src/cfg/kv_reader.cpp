#include "kv_reader.hpp"
#include "cfg_exception.hpp"
#include "utils/string.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cerrno>
#include <fstream>
#include <string>

namespace fractalflake::cfg {

std::vector<kv_entry> read_key_values(std::istream &in)
{
    using boost::algorithm::trim_copy;

    std::vector<kv_entry> entries;
    std::string raw;
    std::size_t line_number = 0;

    while (std::getline(in, raw)) {
        ++line_number;

        const std::string line = trim_copy(raw);
        if (line.empty())
            continue;

        const auto pos = line.find('=');
        if (pos == std::string::npos)
            throw missing_equals_error(line_number);

        entries.push_back({line_number, trim_copy(line.substr(0, pos)), trim_copy(line.substr(pos + 1))});
    }

    return entries;
}


std::vector<kv_entry> read_key_values_file(const std::filesystem::path &path)
{
    errno = 0;
    std::ifstream in(path);
    if (!in)
        throw config_io_error(path.string(), errno != 0 ? utils::string::str_err(errno) : "cannot open file");

    auto entries = read_key_values(in);
    if (in.bad())
        throw config_io_error(path.string(), "read failure");

    return entries;
}

} // namespace fractalflake::cfg
