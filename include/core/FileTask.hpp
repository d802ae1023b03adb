#pragma once

#include <string>
#include "core/Errors.hpp"

namespace reeldrop {

enum class TaskState {
    Pending,
    Acquiring,
    Transferring,
    Publishing,
    Done,
    Failed,
};

inline const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "Pending";
        case TaskState::Acquiring: return "Acquiring";
        case TaskState::Transferring: return "Transferring";
        case TaskState::Publishing: return "Publishing";
        case TaskState::Done: return "Done";
        case TaskState::Failed: return "Failed";
        default: return "Unknown";
    }
}

/**
 * One source file moving through the upload steps. Owned by a single workflow run.
 */
struct FileTask {
    explicit FileTask(const std::string& sourcePath);

    std::string path;
    std::string title;                  // file name without extension
    TaskState state = TaskState::Pending;
    ErrorKind error = ErrorKind::None;
    std::string errorDetail;

    std::string postId;
    int transferAttempts = 0;
    bool alreadyPosted = false;         // createPost reported a conflict
    bool sourceRemoved = false;

    bool terminal() const { return state == TaskState::Done || state == TaskState::Failed; }
};

} // namespace reeldrop
