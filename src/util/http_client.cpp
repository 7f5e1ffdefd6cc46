#include "docsync/util/http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace docsync::util {

struct HttpClient::Impl {
    CURL* curl = nullptr;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total_size = size * nmemb;
    response->append(static_cast<char*>(contents), total_size);
    return total_size;
}

static size_t HeaderCallback(char* buffer, size_t size, size_t nitems,
                             std::map<std::string, std::string>* headers) {
    size_t total_size = size * nitems;
    std::string line(buffer, total_size);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);
        (*headers)[name] = value;
    }
    return total_size;
}

std::string HttpResponse::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
}

HttpClient::HttpClient(long timeout_seconds)
    : pImpl(std::make_unique<Impl>()), timeout_seconds_(timeout_seconds) {
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Result<HttpResponse> HttpClient::get(const std::string& url,
                                     const std::vector<std::string>& headers) {
    return perform("GET", url, nullptr, headers);
}

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<std::string>& headers) {
    return perform("POST", url, &body, headers);
}

Result<HttpResponse> HttpClient::patch(const std::string& url,
                                       const std::string& body,
                                       const std::vector<std::string>& headers) {
    return perform("PATCH", url, &body, headers);
}

Result<HttpResponse> HttpClient::perform(const std::string& method,
                                         const std::string& url,
                                         const std::string* body,
                                         const std::vector<std::string>& headers) {
    if (!pImpl || !pImpl->curl) {
        return std::unexpected(makeError(ErrorCode::kNetworkError, "CURL not initialized"));
    }

    HttpResponse response;
    long response_code = 0;

    // Reset curl handle
    curl_easy_reset(pImpl->curl);

    curl_easy_setopt(pImpl->curl, CURLOPT_URL, url.c_str());

    if (method == "POST") {
        curl_easy_setopt(pImpl->curl, CURLOPT_POST, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(pImpl->curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    if (body) {
        curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(pImpl->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->length()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(pImpl->curl, CURLOPT_HTTPHEADER, header_list);
    }

    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(pImpl->curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(pImpl->curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(pImpl->curl, CURLOPT_HEADERDATA, &response.headers);

    // Bounded request time; background threads must not hang on a dead peer
    curl_easy_setopt(pImpl->curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(pImpl->curl, CURLOPT_CONNECTTIMEOUT, std::min(timeout_seconds_, 15L));
    curl_easy_setopt(pImpl->curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(pImpl->curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(makeError(ErrorCode::kTimeout,
                                         method + " " + url + " timed out after " +
                                         std::to_string(timeout_seconds_) + "s"));
    }
    if (res != CURLE_OK) {
        return std::unexpected(makeError(ErrorCode::kNetworkError,
                                         "HTTP request failed: " + std::string(curl_easy_strerror(res))));
    }

    curl_easy_getinfo(pImpl->curl, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);

    return response;
}

} // namespace docsync::util
