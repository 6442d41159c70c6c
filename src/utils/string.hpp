#pragma once
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <optional>
#include <string>

namespace fractalflake::utils::string {

std::string str_err(int errnum);

// Parses a base-10 unsigned integer that must fit in T. An optional leading
// '+' is accepted; '-', whitespace and out-of-range values are not.
template<typename T> std::optional<T> parse_unsigned(const std::string &src)
{
    if (src.empty() || src.front() == '-')
        return std::nullopt;

    T result{};
    if (!boost::conversion::try_lexical_convert(src, result))
        return std::nullopt;

    return result;
}

} // namespace fractalflake::utils::string
