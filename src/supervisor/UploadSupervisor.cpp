#include "supervisor/UploadSupervisor.hpp"
#include "util/Log.hpp"
#include <boost/asio/post.hpp>
#include <utility>

namespace reeldrop {

UploadSupervisor::UploadSupervisor(boost::asio::any_io_executor executor, Job job, std::size_t maxConcurrent)
    : executor_(std::move(executor)), job_(std::move(job)), maxConcurrent_(maxConcurrent) {}

bool UploadSupervisor::admit(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (halted_ || closed_) {
            log::warn("Not admitting " + path + ": uploads are " + (halted_ ? "halted" : "shutting down"));
            return false;
        }
        if (!registry_.insert(path).second) {
            log::info("Skipping " + path + ": already being processed");
            return false;
        }
        if (maxConcurrent_ != 0 && running_ >= maxConcurrent_) {
            pending_.push_back(path);
            log::info("Queued " + path + " (" + std::to_string(pending_.size()) + " waiting)");
            return true;
        }
        ++running_;
    }

    launch(path);
    return true;
}

void UploadSupervisor::setFatalHandler(FatalHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    fatalHandler_ = std::move(handler);
}

void UploadSupervisor::close() {
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        dropped = dropPendingLocked();
    }
    for (const auto& path : dropped) {
        log::warn("Not processed before shutdown, left in place: " + path);
    }
}

bool UploadSupervisor::waitIdle(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, grace, [this]() { return running_ == 0; });
}

bool UploadSupervisor::isInFlight(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.count(path) != 0;
}

std::vector<std::string> UploadSupervisor::inFlightPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(registry_.begin(), registry_.end());
}

std::size_t UploadSupervisor::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t UploadSupervisor::queuedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool UploadSupervisor::halted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return halted_;
}

void UploadSupervisor::launch(const std::string& path) {
    boost::asio::post(executor_, [this, path]() {
        bool stopped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped = halted_ || closed_;
        }

        FileTask task = stopped ? skipJob(path) : runJob(path);
        finish(path, task);
    });
}

FileTask UploadSupervisor::skipJob(const std::string& path) {
    FileTask task(path);
    task.state = TaskState::Failed;
    task.error = ErrorKind::Cancelled;
    task.errorDetail = "uploads stopped before this file started";
    log::warn("path=" + path + " state=Failed error=" + to_string(task.error) +
              " detail=\"" + task.errorDetail + "\" (file kept)");
    return task;
}

FileTask UploadSupervisor::runJob(const std::string& path) {
    try {
        return job_(path);
    } catch (const std::exception& e) {
        FileTask task(path);
        task.state = TaskState::Failed;
        task.error = ErrorKind::Internal;
        task.errorDetail = e.what();
        log::error("path=" + path + " state=Failed error=" + to_string(task.error) +
                   " detail=\"" + task.errorDetail + "\"");
        return task;
    }
}

void UploadSupervisor::finish(const std::string& path, const FileTask& task) {
    std::vector<std::string> next;
    std::vector<std::string> dropped;
    FatalHandler fatal;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        registry_.erase(path);
        --running_;

        if (task.error == ErrorKind::Auth && !halted_) {
            halted_ = true;
            dropped = dropPendingLocked();
            fatal = fatalHandler_;
        }

        while (!halted_ && !closed_ && !pending_.empty() &&
               (maxConcurrent_ == 0 || running_ < maxConcurrent_)) {
            next.push_back(pending_.front());
            pending_.pop_front();
            ++running_;
        }

        if (running_ == 0) {
            idle_.notify_all();
        }
    }

    for (const auto& path : dropped) {
        log::warn("Not processed after authentication failure, left in place: " + path);
    }
    for (const auto& path : next) {
        launch(path);
    }
    if (fatal) {
        fatal(task);
    }
}

std::vector<std::string> UploadSupervisor::dropPendingLocked() {
    std::vector<std::string> dropped(pending_.begin(), pending_.end());
    for (const auto& path : dropped) {
        registry_.erase(path);
    }
    pending_.clear();
    return dropped;
}

} // namespace reeldrop
