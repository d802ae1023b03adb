#pragma once

#include <string>
#include "http/HttpClient.hpp"

namespace reeldrop {

/**
 * Destination handed out by the server for one file. Lives for one workflow run.
 */
struct UploadSession {
    std::string url;    // where the bytes go
    std::string hash;   // content identifier the post refers to
};

using ProgressCallback = http::ProgressCallback;

/**
 * The three remote operations behind one upload. Implementations throw
 * UploadError subclasses (see core/Errors.hpp) and nothing else.
 */
class UploadClient {
public:
    virtual ~UploadClient() = default;

    // AuthError, ProtocolError
    virtual UploadSession requestUploadTarget() = 0;

    // Sends the file from byte zero; returns the content hash to publish.
    // TransferError, ProtocolError
    virtual std::string transfer(const std::string& path, const UploadSession& session,
                                 const ProgressCallback& progress) = 0;

    // Returns the new post id. AuthError, ProtocolError, ConflictError
    virtual std::string createPost(const std::string& title, const std::string& contentHash,
                                   int categoryId) = 0;
};

} // namespace reeldrop
