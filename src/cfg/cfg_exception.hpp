#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace fractalflake::cfg {

class cfg_exception : public std::runtime_error {
public:
    explicit cfg_exception(const std::string &what)
        : runtime_error{what}
    { }
};


// The configuration source could not be opened or read.
class config_io_error : public cfg_exception {
public:
    config_io_error(std::string path, std::string reason);

    const std::string &path() const { return path_; }
    const std::string &reason() const { return reason_; }

private:
    std::string path_;
    std::string reason_;
};


// A line without a '=' separator.
class missing_equals_error : public cfg_exception {
public:
    explicit missing_equals_error(std::size_t line);

    std::size_t line() const { return line_; }

private:
    std::size_t line_;
};


// A value that does not convert to the option's type.
class invalid_value_error : public cfg_exception {
public:
    invalid_value_error(std::string option, std::size_t line, std::string value);

    const std::string &option() const { return option_; }
    std::size_t line() const { return line_; }
    const std::string &value() const { return value_; }

private:
    std::string option_;
    std::size_t line_;
    std::string value_;
};

} // namespace fractalflake::cfg
