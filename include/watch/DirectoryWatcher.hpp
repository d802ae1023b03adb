#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <sys/inotify.h>
#include <array>
#include <functional>
#include <string>

namespace reeldrop {

struct FileEvent {
    std::string path;
    bool isDirectory = false;
};

/**
 * inotify subscription on one flat directory, read through the io_context.
 *
 * An entry is reported once it has been closed after writing or moved into the
 * directory, so a half-copied file does not show up at open time. Losing the
 * directory itself or a failed read raises WatchError out of io_context::run().
 */
class DirectoryWatcher {
public:
    using Handler = std::function<void(const FileEvent& event)>;

    DirectoryWatcher(boost::asio::io_context& io_context, const std::string& directory);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    void subscribe(Handler handler);
    void stop();

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
    boost::asio::posix::stream_descriptor stream_;
    int watchDescriptor_ = -1;
    Handler handler_;
    bool stopped_ = false;
    alignas(struct inotify_event) std::array<char, 64 * 1024> buffer_;

    void readEvents();
    void dispatch(std::size_t bytes);
};

} // namespace reeldrop
