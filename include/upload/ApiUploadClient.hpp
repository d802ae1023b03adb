#pragma once

#include <string>
#include <vector>
#include "core/Config.hpp"
#include "core/StopSource.hpp"
#include "http/HttpClient.hpp"
#include "upload/FileTransfer.hpp"
#include "upload/UploadClient.hpp"

namespace reeldrop {

/**
 * UploadClient backed by the posts API:
 *   GET  {api}/posts/generate-upload-url  -> {"url", "hash"}
 *   PUT  <url>                            raw file bytes
 *   POST {api}/posts                      {"title", "hash", "is_available_in_public_feed", "category_id"}
 */
class ApiUploadClient : public UploadClient {
public:
    explicit ApiUploadClient(const Config& config, const StopSource* stop = nullptr);

    UploadSession requestUploadTarget() override;

    std::string transfer(const std::string& path, const UploadSession& session,
                         const ProgressCallback& progress) override;

    std::string createPost(const std::string& title, const std::string& contentHash,
                           int categoryId) override;

private:
    const Config& config_;
    http::HttpClient api_;
    FileTransfer files_;

    std::vector<std::string> authHeaders() const;

    // Throws AuthError or ProtocolError for a failed API response
    void checkStatus(const std::string& operation, const http::Response& response) const;
};

} // namespace reeldrop
