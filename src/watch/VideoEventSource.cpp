#include "watch/VideoEventSource.hpp"
#include "util/Log.hpp"
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace reeldrop {

VideoEventSource::VideoEventSource(const WatchTarget& target, Forward forward)
    : target_(target), forward_(std::move(forward)) {}

bool VideoEventSource::accepts(const FileEvent& event) const {
    if (event.isDirectory) {
        return false;
    }

    std::string name = fs::path(event.path).filename().string();
    const std::string& suffix = target_.suffix;
    if (name.empty() || name[0] == '.' || name.size() <= suffix.size()) {
        return false;
    }
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }

    std::error_code ec;
    return fs::is_regular_file(event.path, ec);
}

void VideoEventSource::onEvent(const FileEvent& event) {
    if (!accepts(event)) {
        return;
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(event.path, ec);
    std::string path = ec ? event.path : absolute.lexically_normal().string();

    log::info("New video detected: " + path);
    forward_(path);
}

} // namespace reeldrop
