#pragma once
#include <curl/curl.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace fractalflake::http {

// RAII libcurl initializer
class sys_initializer {
public:
    // Init
    sys_initializer();

    // Cleanup
    ~sys_initializer();
};


// The request could not be completed (resolution, connection, timeout...).
class http_exception : public std::runtime_error {
public:
    explicit http_exception(const std::string &what)
        : runtime_error{what}
    { }
};


struct response {
    long status = 0;
    std::string body;
};


// A single synchronous GET request.
class request {
public:
    explicit request(const std::string &url);

    // seconds; -1 leaves libcurl's default in place
    void set_timeout(long timeout) const;

    // Any HTTP status is a completed request; only transport failures throw.
    response perform() const;

private:
    static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *ud);

private:
    // CURL wrapper
    struct internals_type {
        internals_type()
            : err_buf{}
        {
            if ((curl = curl_easy_init()) == nullptr)
                throw std::runtime_error("curl_easy_init() failure");
        }

        ~internals_type() { curl_easy_cleanup(curl); }

        CURL *curl;
        std::string url;
        std::string body;
        char err_buf[CURL_ERROR_SIZE + 1];
    };

    std::shared_ptr<internals_type> internals_;
};


response get(const std::string &url, long timeout = -1);

} // namespace fractalflake::http
