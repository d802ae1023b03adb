#pragma once

#include <chrono>
#include <string>
#include "core/FileTask.hpp"
#include "core/StopSource.hpp"
#include "upload/ProgressBoard.hpp"
#include "upload/UploadClient.hpp"

namespace reeldrop {

struct WorkflowOptions {
    int categoryId = 25;
    int transferRetries = 1;
    // Wait this long and require an unchanged size and mtime before acquiring; 0 skips the check
    std::chrono::milliseconds settleDelay{0};
};

/**
 * Drives one file through
 *   Pending -> Acquiring -> Transferring -> Publishing -> Done
 * with any failure going straight to Failed.
 *
 * Done deletes the source file; Failed leaves it where it is. run() never
 * throws: every outcome comes back as a terminal FileTask.
 */
class UploadWorkflow {
public:
    UploadWorkflow(UploadClient& client, WorkflowOptions options,
                   ProgressBoard* board = nullptr, const StopSource* stop = nullptr);

    FileTask run(const std::string& path) const;

private:
    UploadClient& client_;
    WorkflowOptions options_;
    ProgressBoard* board_;
    const StopSource* stop_;

    void checkSource(const FileTask& task) const;
    void checkStop(const FileTask& task, TaskState next) const;
    std::string transferWithRetry(FileTask& task, const UploadSession& session) const;
    void removeSource(FileTask& task) const;

    static void advance(FileTask& task, TaskState next);
    static void fail(FileTask& task, ErrorKind kind, const std::string& detail);
    static void report(const FileTask& task);
};

} // namespace reeldrop
