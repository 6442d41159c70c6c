#include "cfg_exception.hpp"
#include <fmt/core.h>
#include <utility>

namespace fractalflake::cfg {

config_io_error::config_io_error(std::string path, std::string reason)
    : cfg_exception{fmt::format(R"(IO error while reading config "{}": {})", path, reason)}, path_{std::move(path)},
      reason_{std::move(reason)}
{ }


missing_equals_error::missing_equals_error(std::size_t line)
    : cfg_exception{fmt::format("Missing equals sign at line {}", line)}, line_{line}
{ }


invalid_value_error::invalid_value_error(std::string option, std::size_t line, std::string value)
    : cfg_exception{fmt::format(R"(Invalid {} value of "{}" at line {})", option, value, line)},
      option_{std::move(option)}, line_{line}, value_{std::move(value)}
{ }

} // namespace fractalflake::cfg
