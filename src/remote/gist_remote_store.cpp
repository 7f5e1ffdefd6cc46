#include "docsync/remote/gist_remote_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "docsync/util/time.hpp"

namespace docsync::remote {

namespace {

constexpr size_t kMaxErrorBody = 200;

std::string shorten(const std::string& body) {
    if (body.size() <= kMaxErrorBody) {
        return body;
    }
    return body.substr(0, kMaxErrorBody) + "...";
}

} // namespace

GistRemoteStore::GistRemoteStore(GistOptions options)
    : options_(std::move(options)),
      client_(std::make_unique<util::HttpClient>(options_.timeout_seconds)) {
    while (!options_.api_url.empty() && options_.api_url.back() == '/') {
        options_.api_url.pop_back();
    }
}

std::vector<std::string> GistRemoteStore::headers(bool with_body) const {
    std::vector<std::string> result = {
        "Authorization: token " + options_.token,
        "Accept: application/vnd.github+json",
        "User-Agent: docsync/" + getVersion().toString()
    };
    if (with_body) {
        result.push_back("Content-Type: application/json");
    }
    return result;
}

std::string GistRemoteStore::gistUrl(const std::string& id) const {
    return options_.api_url + "/gists/" + id;
}

Result<std::optional<RemoteArtifact>> GistRemoteStore::fetch(const std::string& id) {
    if (options_.token.empty()) {
        return std::unexpected(makeError(ErrorCode::kAuthError, "Remote token not configured"));
    }
    if (id.empty()) {
        return std::optional<RemoteArtifact>{};
    }

    spdlog::debug("Fetching gist {}", id);
    auto response = client_->get(gistUrl(id), headers(false));
    if (!response.has_value()) {
        spdlog::warn("Gist fetch failed: {}", response.error().message());
        return std::unexpected(response.error());
    }

    return parseFetchResponse(*response, options_.file_name);
}

Result<RemoteLocation> GistRemoteStore::put(const std::optional<std::string>& id,
                                            const std::string& content) {
    if (options_.token.empty()) {
        return std::unexpected(makeError(ErrorCode::kAuthError, "Remote token not configured"));
    }

    auto body = buildPutBody(options_.description, options_.file_name, content);
    const bool update = id.has_value() && !id->empty();
    if (update) {
        spdlog::debug("Updating gist {}", *id);
    } else {
        spdlog::debug("Creating gist");
    }
    auto response = update ? client_->patch(gistUrl(*id), body, headers(true))
                           : client_->post(options_.api_url + "/gists", body, headers(true));

    if (!response.has_value()) {
        spdlog::warn("Gist write failed: {}", response.error().message());
        return std::unexpected(response.error());
    }

    return parsePutResponse(*response);
}

Error GistRemoteStore::statusError(const util::HttpResponse& response) {
    const int status = response.status_code;
    const std::string detail = "GitHub API error " + std::to_string(status) +
                               (response.body.empty() ? "" : ": " + shorten(response.body));

    if (status == 429) {
        return makeError(ErrorCode::kRateLimited, detail);
    }
    if (status == 403) {
        if (response.header("x-ratelimit-remaining") == "0") {
            return makeError(ErrorCode::kRateLimited, detail);
        }
        return makeError(ErrorCode::kAuthError, detail);
    }
    if (status == 401) {
        return makeError(ErrorCode::kAuthError, detail);
    }
    return makeError(ErrorCode::kRemoteError, detail);
}

Result<std::optional<RemoteArtifact>> GistRemoteStore::parseFetchResponse(
    const util::HttpResponse& response, const std::string& file_name) {
    if (response.status_code == 404) {
        return std::optional<RemoteArtifact>{};
    }
    if (!response.ok()) {
        return std::unexpected(statusError(response));
    }

    try {
        auto gist = nlohmann::json::parse(response.body);

        if (!gist.contains("files") || !gist["files"].is_object()) {
            return std::unexpected(makeError(ErrorCode::kRemoteError,
                                             "Invalid gist response: missing files"));
        }

        const auto& files = gist["files"];
        auto file_it = files.find(file_name);
        if (file_it == files.end() || file_it->is_null()) {
            spdlog::debug("Gist has no {}", file_name);
            return std::optional<RemoteArtifact>{};
        }

        if (file_it->value("truncated", false)) {
            return std::unexpected(makeError(ErrorCode::kRemoteError,
                                             file_name + " is truncated in the gist response"));
        }
        if (!file_it->contains("content") || !(*file_it)["content"].is_string()) {
            return std::unexpected(makeError(ErrorCode::kRemoteError,
                                             "Invalid gist response: missing content"));
        }

        RemoteArtifact artifact;
        artifact.content = (*file_it)["content"].get<std::string>();

        if (gist.contains("updated_at") && gist["updated_at"].is_string()) {
            auto updated = util::Time::fromRfc3339(gist["updated_at"].get<std::string>());
            if (updated.has_value()) {
                artifact.server_updated_at = *updated;
            }
        }

        return std::optional<RemoteArtifact>(std::move(artifact));

    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(makeError(ErrorCode::kRemoteError,
                                         "Failed to parse gist response: " + std::string(e.what())));
    }
}

Result<RemoteLocation> GistRemoteStore::parsePutResponse(const util::HttpResponse& response) {
    if (!response.ok()) {
        return std::unexpected(statusError(response));
    }

    try {
        auto gist = nlohmann::json::parse(response.body);

        if (!gist.contains("id") || !gist["id"].is_string()) {
            return std::unexpected(makeError(ErrorCode::kRemoteError,
                                             "Invalid gist response: missing id"));
        }

        RemoteLocation location;
        location.id = gist["id"].get<std::string>();
        location.url = gist.value("html_url", std::string{});
        return location;

    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(makeError(ErrorCode::kRemoteError,
                                         "Failed to parse gist response: " + std::string(e.what())));
    }
}

std::string GistRemoteStore::buildPutBody(const std::string& description,
                                          const std::string& file_name,
                                          const std::string& content) {
    nlohmann::json body;
    body["description"] = description;
    body["files"][file_name]["content"] = content;
    return body.dump();
}

} // namespace docsync::remote
