#pragma once
#include "cfg/cfg_exception.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fractalflake::seed {

class invalid_port_error : public cfg::invalid_value_error {
public:
    invalid_port_error(std::size_t line, const std::string &value)
        : invalid_value_error{"port", line, value}
    { }
};


class invalid_node_error : public cfg::invalid_value_error {
public:
    invalid_node_error(std::size_t line, const std::string &value)
        : invalid_value_error{"node", line, value}
    { }
};


class invalid_epoch_error : public cfg::invalid_value_error {
public:
    invalid_epoch_error(std::size_t line, const std::string &value)
        : invalid_value_error{"epoch", line, value}
    { }
};


// base class for coordinator failures
class sync_exception : public std::runtime_error {
public:
    explicit sync_exception(const std::string &what)
        : runtime_error{what}
    { }
};


// The coordinator could not be reached.
class network_error : public sync_exception {
public:
    network_error(std::string host, std::uint16_t port, const std::string &reason);

    const std::string &host() const { return host_; }
    std::uint16_t port() const { return port_; }

private:
    std::string host_;
    std::uint16_t port_;
};


// The coordinator answered with something other than {"epoch": "..."}.
class deserialization_error : public sync_exception {
public:
    explicit deserialization_error(const std::string &reason);
};


// The coordinator's epoch is not an unsigned 128-bit decimal.
class invalid_sync_epoch_error : public sync_exception {
public:
    explicit invalid_sync_epoch_error(std::string value);

    const std::string &value() const { return value_; }

private:
    std::string value_;
};

} // namespace fractalflake::seed
