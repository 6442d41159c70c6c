#include "http_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace fractalflake::http {

static fractalflake::http::sys_initializer curl;


sys_initializer::sys_initializer()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}


sys_initializer::~sys_initializer()
{
    curl_global_cleanup();
}


request::request(const std::string &url)
    : internals_{std::make_shared<internals_type>()}
{
    internals_->url = url;
    curl_easy_setopt(internals_->curl, CURLOPT_URL, internals_->url.c_str());
    curl_easy_setopt(internals_->curl, CURLOPT_NOSIGNAL, 1L);
    // curl_easy_setopt(internals_->curl, CURLOPT_VERBOSE, 1L);
    curl_easy_setopt(internals_->curl, CURLOPT_ERRORBUFFER, internals_->err_buf);
    curl_easy_setopt(internals_->curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(internals_->curl, CURLOPT_WRITEFUNCTION, request::write_callback);
    curl_easy_setopt(internals_->curl, CURLOPT_WRITEDATA, internals_.get());
}


void request::set_timeout(long timeout) const
{
    if (timeout != -1)
        curl_easy_setopt(internals_->curl, CURLOPT_TIMEOUT, timeout);
}


response request::perform() const
{
    internals_->body.clear();
    internals_->err_buf[0] = '\0';

    spdlog::debug("GET {}", internals_->url);

    const CURLcode rc = curl_easy_perform(internals_->curl);
    if (rc != CURLE_OK) {
        // the error buffer is more specific than curl_easy_strerror() when filled
        const std::string err = internals_->err_buf[0] != '\0' ? internals_->err_buf : curl_easy_strerror(rc);
        throw http_exception(fmt::format("GET {} failed: {}", internals_->url, err));
    }

    response resp;
    curl_easy_getinfo(internals_->curl, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body.swap(internals_->body);

    spdlog::debug("GET {} returned {} ({} bytes)", internals_->url, resp.status, resp.body.size());
    return resp;
}


size_t request::write_callback(char *ptr, size_t size, size_t nmemb, void *ud)
{
    auto *req = reinterpret_cast<internals_type *>(ud);

    req->body.append(ptr, size * nmemb);
    return size * nmemb;
}


response get(const std::string &url, long timeout)
{
    request req(url);
    req.set_timeout(timeout);
    return req.perform();
}

} // namespace fractalflake::http
