#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "docsync/common.hpp"

namespace docsync::util {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    // Header names are lower-cased
    std::map<std::string, std::string> headers;

    bool ok() const { return status_code >= 200 && status_code < 300; }
    std::string header(const std::string& name) const;
};

class HttpClient {
public:
    explicit HttpClient(long timeout_seconds = 60);
    ~HttpClient();

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    Result<HttpResponse> get(const std::string& url,
                             const std::vector<std::string>& headers = {});

    Result<HttpResponse> post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers = {});

    Result<HttpResponse> patch(const std::string& url,
                               const std::string& body,
                               const std::vector<std::string>& headers = {});

    long timeoutSeconds() const { return timeout_seconds_; }

private:
    Result<HttpResponse> perform(const std::string& method,
                                 const std::string& url,
                                 const std::string* body,
                                 const std::vector<std::string>& headers);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
    long timeout_seconds_;
};

} // namespace docsync::util
