#pragma once
#include "http/http_client.hpp"
#include <string>

namespace fractalflake::seed {

// Carries the coordinator request. Throws http::http_exception when the
// request cannot be completed.
class sync_transport {
public:
    virtual ~sync_transport() = default;

    virtual http::response fetch(const std::string &url) = 0;
};


class curl_sync_transport final : public sync_transport {
public:
    // seconds; -1 keeps libcurl's default
    explicit curl_sync_transport(long timeout = -1)
        : timeout_{timeout}
    { }

    http::response fetch(const std::string &url) override { return http::get(url, timeout_); }

private:
    long timeout_;
};

} // namespace fractalflake::seed
