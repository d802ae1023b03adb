#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "core/FileTask.hpp"

namespace reeldrop {

/**
 * Admission control for per-file workflows.
 *
 * Keeps the set of paths that are admitted and not yet finished, so one path is
 * never processed twice at the same time. With maxConcurrent > 0, admissions past
 * the limit wait in FIFO order. Jobs run on the supplied executor; every method
 * is safe to call from any thread.
 *
 * A job that ends with an AuthError halts the supervisor: queued paths are
 * dropped, later admissions are refused and the fatal handler is invoked once.
 * Jobs already handed to the executor but not yet started end as Cancelled
 * after a halt or close(), leaving their files in place.
 */
class UploadSupervisor {
public:
    using Job = std::function<FileTask(const std::string& path)>;
    using FatalHandler = std::function<void(const FileTask& task)>;

    UploadSupervisor(boost::asio::any_io_executor executor, Job job, std::size_t maxConcurrent = 0);

    UploadSupervisor(const UploadSupervisor&) = delete;
    UploadSupervisor& operator=(const UploadSupervisor&) = delete;

    // Returns false if the path is already in flight or the supervisor no longer accepts work
    bool admit(const std::string& path);

    void setFatalHandler(FatalHandler handler);

    // Refuse new admissions and drop queued paths that have not started
    void close();

    // Block until no job is running or the grace period has passed; true if idle
    bool waitIdle(std::chrono::milliseconds grace);

    bool isInFlight(const std::string& path) const;
    std::vector<std::string> inFlightPaths() const;
    std::size_t runningCount() const;
    std::size_t queuedCount() const;
    bool halted() const;

private:
    boost::asio::any_io_executor executor_;
    Job job_;
    std::size_t maxConcurrent_;
    FatalHandler fatalHandler_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::unordered_set<std::string> registry_;
    std::deque<std::string> pending_;
    std::size_t running_ = 0;
    bool closed_ = false;
    bool halted_ = false;

    void launch(const std::string& path);
    FileTask runJob(const std::string& path);
    FileTask skipJob(const std::string& path);
    void finish(const std::string& path, const FileTask& task);
    std::vector<std::string> dropPendingLocked();
};

} // namespace reeldrop
