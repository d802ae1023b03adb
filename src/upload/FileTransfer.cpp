#include "upload/FileTransfer.hpp"
#include "core/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace reeldrop {

FileTransfer::FileTransfer(http::Timeouts timeouts, const StopSource* stop, const std::string& contentType)
    : http_(timeouts), stop_(stop), contentType_(contentType) {}

std::uint64_t FileTransfer::send(const std::string& path, const std::string& url,
                                 const http::ProgressCallback& progress) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw TransferError("Cannot stat " + path + ": " + ec.message());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw TransferError("Cannot open " + path + " for reading");
    }

    std::uint64_t last = 0;
    bool reported = false;
    auto report = [&](std::uint64_t sent, std::uint64_t total) {
        if (reported && sent < last) {
            return;
        }
        last = sent;
        reported = true;
        if (progress) {
            progress(sent, total);
        }
    };

    http::AbortCheck shouldAbort;
    if (stop_) {
        const StopSource* stop = stop_;
        shouldAbort = [stop]() { return stop->abortRequested(); };
    }

    http::Response response;
    try {
        response = http_.put(url, in, size, {"Content-Type: " + contentType_}, report, shouldAbort);
    } catch (const http::RequestError& e) {
        throw TransferError(std::string("Upload of ") + path + " interrupted: " + e.what());
    }

    if (!response.ok()) {
        std::string detail = "Storage endpoint returned " + std::to_string(response.status) + " " +
                             http::status_text(response.status) + ": " + response.body.substr(0, 500);
        if (http::is_transient(response.status)) {
            throw TransferError(detail);
        }
        throw ProtocolError(detail);
    }

    if (!reported || last < size) {
        report(size, size);
    }
    return size;
}

} // namespace reeldrop
