#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docsync/remote/remote_store.hpp"
#include "docsync/util/http_client.hpp"

namespace docsync::remote {

struct GistOptions {
    std::string token;
    std::string api_url = "https://api.github.com";
    std::string file_name = "copilot-instructions.md";
    std::string description = "Copilot Instructions";
    long timeout_seconds = 30;
};

// RemoteStore backed by a single GitHub gist
class GistRemoteStore : public RemoteStore {
public:
    explicit GistRemoteStore(GistOptions options);

    Result<std::optional<RemoteArtifact>> fetch(const std::string& id) override;
    Result<RemoteLocation> put(const std::optional<std::string>& id,
                               const std::string& content) override;

    // Response handling, exposed for tests
    static Result<std::optional<RemoteArtifact>> parseFetchResponse(
        const util::HttpResponse& response, const std::string& file_name);
    static Result<RemoteLocation> parsePutResponse(const util::HttpResponse& response);
    static std::string buildPutBody(const std::string& description,
                                    const std::string& file_name,
                                    const std::string& content);
    static Error statusError(const util::HttpResponse& response);

private:
    std::vector<std::string> headers(bool with_body) const;
    std::string gistUrl(const std::string& id) const;

    GistOptions options_;
    std::unique_ptr<util::HttpClient> client_;
};

} // namespace docsync::remote
