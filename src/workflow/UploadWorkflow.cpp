#include "workflow/UploadWorkflow.hpp"
#include "util/Log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace reeldrop {

UploadWorkflow::UploadWorkflow(UploadClient& client, WorkflowOptions options,
                               ProgressBoard* board, const StopSource* stop)
    : client_(client), options_(options), board_(board), stop_(stop) {}

FileTask UploadWorkflow::run(const std::string& path) const {
    FileTask task(path);

    try {
        checkSource(task);

        checkStop(task, TaskState::Acquiring);
        advance(task, TaskState::Acquiring);
        UploadSession session = client_.requestUploadTarget();

        checkStop(task, TaskState::Transferring);
        advance(task, TaskState::Transferring);
        std::string contentHash = transferWithRetry(task, session);

        checkStop(task, TaskState::Publishing);
        advance(task, TaskState::Publishing);
        try {
            task.postId = client_.createPost(task.title, contentHash, options_.categoryId);
        } catch (const ConflictError& e) {
            log::warn(task.path + ": " + e.what() + "; treating as published");
            task.alreadyPosted = true;
        }

        advance(task, TaskState::Done);
    } catch (const UploadError& e) {
        fail(task, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(task, ErrorKind::Internal, e.what());
    }

    if (task.state == TaskState::Done) {
        removeSource(task);
    }
    report(task);
    return task;
}

void UploadWorkflow::checkSource(const FileTask& task) const {
    std::error_code ec;
    auto status = fs::status(task.path, ec);
    if (ec || !fs::exists(status)) {
        throw LocalIOError("source file is missing");
    }
    if (!fs::is_regular_file(status)) {
        throw LocalIOError("source is not a regular file");
    }

    auto size = fs::file_size(task.path, ec);
    if (ec) {
        throw LocalIOError("cannot stat source: " + ec.message());
    }
    if (size == 0) {
        throw LocalIOError("source file is empty");
    }

    std::ifstream readable(task.path, std::ios::binary);
    if (!readable) {
        throw LocalIOError("source file is not readable");
    }

    if (options_.settleDelay.count() > 0) {
        auto modified = fs::last_write_time(task.path, ec);
        std::this_thread::sleep_for(options_.settleDelay);

        std::error_code later;
        auto settledSize = fs::file_size(task.path, later);
        auto settledModified = fs::last_write_time(task.path, later);
        if (later) {
            throw LocalIOError("source vanished while settling: " + later.message());
        }
        if (settledSize != size || (!ec && settledModified != modified)) {
            throw LocalIOError("source is still being written");
        }
    }
}

void UploadWorkflow::checkStop(const FileTask& task, TaskState next) const {
    if (stop_ && stop_->stopRequested()) {
        throw CancelledError(std::string("shutdown requested before ") + to_string(next) +
                             " (was " + to_string(task.state) + ")");
    }
}

std::string UploadWorkflow::transferWithRetry(FileTask& task, const UploadSession& session) const {
    std::shared_ptr<TransferProgress> entry;
    if (board_) {
        std::error_code ec;
        auto size = fs::file_size(task.path, ec);
        entry = board_->track(fs::path(task.path).filename().string(), ec ? 0 : size);
    }

    ProgressCallback progress;
    if (entry) {
        progress = [entry](std::uint64_t sent, std::uint64_t total) { entry->update(sent, total); };
    }

    for (int attempt = 1;; ++attempt) {
        task.transferAttempts = attempt;
        try {
            return client_.transfer(task.path, session, progress);
        } catch (const TransferError& e) {
            bool stopping = stop_ && stop_->stopRequested();
            if (attempt > options_.transferRetries || stopping) {
                throw;
            }
            log::warn(task.path + ": transfer attempt " + std::to_string(attempt) + " failed (" +
                      e.what() + "); retrying from byte zero");
        }
    }
}

void UploadWorkflow::removeSource(FileTask& task) const {
    std::error_code ec;
    bool removed = fs::remove(task.path, ec);
    if (ec || !removed) {
        std::string reason = ec ? ec.message() : "file already gone";
        log::error(std::string(to_string(ErrorKind::LocalIO)) + " path=" + task.path +
                   " could not delete uploaded file (" + reason + "); remove it manually");
        return;
    }
    task.sourceRemoved = true;
    log::info("Deleted local file: " + task.path);
}

void UploadWorkflow::advance(FileTask& task, TaskState next) {
    log::info(task.path + ": " + to_string(task.state) + " -> " + to_string(next));
    task.state = next;
}

void UploadWorkflow::fail(FileTask& task, ErrorKind kind, const std::string& detail) {
    task.error = kind;
    task.errorDetail = detail;
    task.state = TaskState::Failed;
}

void UploadWorkflow::report(const FileTask& task) {
    if (task.state == TaskState::Done) {
        std::string line = "path=" + task.path + " state=Done title=\"" + task.title + "\"";
        line += " post_id=" + (task.postId.empty() ? std::string("-") : task.postId);
        line += " transfer_attempts=" + std::to_string(task.transferAttempts);
        if (task.alreadyPosted) {
            line += " already_posted=true";
        }
        log::info(line);
        return;
    }

    log::error("path=" + task.path + " state=" + to_string(task.state) + " error=" + to_string(task.error) +
               " detail=\"" + task.errorDetail + "\" (file kept)");
}

} // namespace reeldrop
