#include "watch/DirectoryWatcher.hpp"
#include "core/Errors.hpp"
#include "util/Log.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>

namespace reeldrop {

namespace {
    constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;
    constexpr uint32_t kLostMask = IN_DELETE_SELF | IN_MOVE_SELF | IN_UNMOUNT | IN_IGNORED;
}

DirectoryWatcher::DirectoryWatcher(boost::asio::io_context& io_context, const std::string& directory)
    : directory_(directory), stream_(io_context) {
    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw WatchError(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }
    stream_.assign(fd);

    watchDescriptor_ = ::inotify_add_watch(fd, directory_.c_str(), kWatchMask);
    if (watchDescriptor_ < 0) {
        throw WatchError("Cannot watch " + directory_ + ": " + std::strerror(errno));
    }
}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

void DirectoryWatcher::subscribe(Handler handler) {
    handler_ = std::move(handler);
    readEvents();
}

void DirectoryWatcher::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    boost::system::error_code ec;
    stream_.cancel(ec);
    stream_.close(ec);
}

void DirectoryWatcher::readEvents() {
    stream_.async_read_some(boost::asio::buffer(buffer_),
        [this](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec == boost::asio::error::operation_aborted || stopped_) {
                return;
            }
            if (ec) {
                throw WatchError("Reading events for " + directory_ + " failed: " + ec.message());
            }
            dispatch(bytes);
            readEvents();
        });
}

void DirectoryWatcher::dispatch(std::size_t bytes) {
    std::size_t offset = 0;
    while (offset + sizeof(struct inotify_event) <= bytes) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(buffer_.data() + offset);
        offset += sizeof(struct inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            log::warn("Event queue for " + directory_ + " overflowed; some new files may have been missed");
            continue;
        }
        if (event->mask & kLostMask) {
            throw WatchError("Watched directory " + directory_ + " is no longer available");
        }
        if (event->len == 0 || !handler_) {
            continue;
        }

        FileEvent fileEvent;
        fileEvent.path = (std::filesystem::path(directory_) / event->name).string();
        fileEvent.isDirectory = (event->mask & IN_ISDIR) != 0;
        handler_(fileEvent);
    }
}

} // namespace reeldrop
