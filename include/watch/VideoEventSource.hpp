#pragma once

#include <functional>
#include <string>
#include "core/Config.hpp"
#include "watch/DirectoryWatcher.hpp"

namespace reeldrop {

/**
 * Turns raw directory events into upload requests: regular files whose name ends
 * with the target suffix are forwarded once, as an absolute path. Everything else
 * (directories, other extensions, dot-files, entries already gone) is dropped quietly.
 */
class VideoEventSource {
public:
    using Forward = std::function<bool(const std::string& path)>;

    VideoEventSource(const WatchTarget& target, Forward forward);

    bool accepts(const FileEvent& event) const;
    void onEvent(const FileEvent& event);

private:
    const WatchTarget& target_;
    Forward forward_;
};

} // namespace reeldrop
