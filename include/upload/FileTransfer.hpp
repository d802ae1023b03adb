#pragma once

#include <cstdint>
#include <string>
#include "http/HttpClient.hpp"
#include "core/StopSource.hpp"

namespace reeldrop {

/**
 * Streams a local file to a storage URL with PUT.
 *
 * Progress reports never decrease and the last one always equals the file size.
 * Network and read failures raise TransferError; a non-transient rejection by
 * the endpoint raises ProtocolError.
 */
class FileTransfer {
public:
    explicit FileTransfer(http::Timeouts timeouts, const StopSource* stop = nullptr,
                          const std::string& contentType = "application/octet-stream");

    // Returns the number of bytes sent
    std::uint64_t send(const std::string& path, const std::string& url,
                       const http::ProgressCallback& progress) const;

private:
    http::HttpClient http_;
    const StopSource* stop_;
    std::string contentType_;
};

} // namespace reeldrop
