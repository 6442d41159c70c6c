#include "settings.hpp"
#include "cfg_exception.hpp"
#include "kv_reader.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include <set>
#include <string>
#include <vector>

namespace fractalflake::cfg {

namespace {

settings apply(const std::vector<kv_entry> &entries)
{
    using boost::algorithm::to_lower_copy;

    settings s;
    for (const auto &[line, key, value]: entries) {
        if (key == "log_type") {
            s.log_type = to_lower_copy(value);
        } else if (key == "log_priority") {
            s.log_priority = to_lower_copy(value);
        } else if (key == "log_facility") {
            s.log_facility = to_lower_copy(value);
        } else if (key == "sync_timeout") {
            try {
                s.sync_timeout = boost::lexical_cast<long>(value);
            } catch (const boost::bad_lexical_cast &) {
                throw invalid_value_error("sync_timeout", line, value);
            }
        }
    }

    s.validate();
    return s;
}

} // namespace


void settings::validate() const
{
    static const std::set<std::string> priorities = {"trace", "debug", "info", "warning", "error", "critical"};
    static const std::set<std::string> facilities = {"user",   "mail",   "news",   "uucp",   "daemon", "auth",
                                                     "cron",   "lpr",    "local0", "local1", "local2", "local3",
                                                     "local4", "local5", "local6", "local7"};

    if (log_type != "console" && log_type != "syslog")
        throw cfg_exception(fmt::format(R"(invalid value for "log_type" ({}); expected console or syslog)", log_type));

    if (priorities.find(log_priority) == priorities.end())
        throw cfg_exception(fmt::format(R"(invalid value for "log_priority" ({}))", log_priority));

    if (facilities.find(log_facility) == facilities.end())
        throw cfg_exception(fmt::format(R"(invalid value for "log_facility" ({}))", log_facility));

    if (sync_timeout < -1)
        throw cfg_exception(fmt::format(R"(invalid value for "sync_timeout" ({}); must be >= -1)", sync_timeout));
}


settings load_settings(std::istream &in)
{
    return apply(read_key_values(in));
}


settings load_settings_file(const std::filesystem::path &path)
{
    return apply(read_key_values_file(path));
}

} // namespace fractalflake::cfg
