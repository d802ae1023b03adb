#include "upload/ApiUploadClient.hpp"
#include "core/Errors.hpp"
#include "util/Log.hpp"
#include <nlohmann/json.hpp>

namespace reeldrop {

namespace {
    http::Timeouts apiTimeouts(const Config& config) {
        http::Timeouts timeouts;
        timeouts.totalSeconds = config.requestTimeoutSeconds;
        return timeouts;
    }

    http::Timeouts transferTimeouts(const Config& config) {
        http::Timeouts timeouts;
        timeouts.totalSeconds = config.transferTimeoutSeconds;
        timeouts.stallSeconds = 60;
        return timeouts;
    }

    std::string trimTrailingSlash(std::string url) {
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }

    std::string describe(const http::Response& response) {
        return std::to_string(response.status) + " " + http::status_text(response.status) +
               ": " + response.body.substr(0, 500);
    }

    nlohmann::json parseObject(const std::string& operation, const http::Response& response) {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw ProtocolError(operation + ": response is not JSON (" + e.what() + "): " +
                                response.body.substr(0, 500));
        }
        if (!json.is_object()) {
            throw ProtocolError(operation + ": expected a JSON object, got " + json.dump().substr(0, 500));
        }
        return json;
    }
}

ApiUploadClient::ApiUploadClient(const Config& config, const StopSource* stop)
    : config_(config), api_(apiTimeouts(config)), files_(transferTimeouts(config), stop) {}

std::vector<std::string> ApiUploadClient::authHeaders() const {
    return {config_.authHeader + ": " + config_.token};
}

void ApiUploadClient::checkStatus(const std::string& operation, const http::Response& response) const {
    if (response.ok()) {
        return;
    }
    if (http::is_auth_failure(response.status)) {
        throw AuthError(operation + ": token rejected (" + describe(response) + ")");
    }
    throw ProtocolError(operation + ": unexpected status " + describe(response));
}

UploadSession ApiUploadClient::requestUploadTarget() {
    const std::string operation = "generate-upload-url";
    http::Response response;
    try {
        response = api_.get(trimTrailingSlash(config_.apiBaseUrl) + "/posts/generate-upload-url", authHeaders());
    } catch (const http::RequestError& e) {
        throw ProtocolError(operation + ": request failed: " + e.what());
    }
    checkStatus(operation, response);

    nlohmann::json json = parseObject(operation, response);

    UploadSession session;
    if (json.contains("url") && json["url"].is_string()) {
        session.url = json["url"].get<std::string>();
    }
    for (const char* key : {"hash", "key"}) {
        if (json.contains(key) && json[key].is_string()) {
            session.hash = json[key].get<std::string>();
            break;
        }
    }

    if (session.url.empty() || session.hash.empty()) {
        throw ProtocolError(operation + ": response lacks 'url' or 'hash': " + json.dump().substr(0, 500));
    }
    return session;
}

std::string ApiUploadClient::transfer(const std::string& path, const UploadSession& session,
                                      const ProgressCallback& progress) {
    files_.send(path, session.url, progress);
    return session.hash;
}

std::string ApiUploadClient::createPost(const std::string& title, const std::string& contentHash,
                                        int categoryId) {
    const std::string operation = "create-post";

    nlohmann::json requestBody = {
        {"title", title},
        {"hash", contentHash},
        {"is_available_in_public_feed", config_.publicFeed},
        {"category_id", categoryId}
    };

    http::Response response;
    try {
        response = api_.postJson(trimTrailingSlash(config_.apiBaseUrl) + "/posts", requestBody.dump(),
                                 authHeaders());
    } catch (const http::RequestError& e) {
        throw ProtocolError(operation + ": request failed: " + e.what());
    }

    if (response.status == 409) {
        throw ConflictError(operation + ": content " + contentHash + " already posted");
    }
    checkStatus(operation, response);

    nlohmann::json json = parseObject(operation, response);

    auto it = json.find("id");
    if (it == json.end()) {
        log::warn(operation + ": response carries no post id: " + json.dump().substr(0, 200));
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return it->dump();
    }
    throw ProtocolError(operation + ": unexpected id value " + it->dump());
}

} // namespace reeldrop
