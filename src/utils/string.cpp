#include "string.hpp"
#include <string>
#include <system_error>

namespace fractalflake::utils::string {

std::string str_err(int errnum)
{
    return std::system_category().message(errnum);
}

} // namespace fractalflake::utils::string
