#include "upload/ProgressBoard.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace reeldrop {

TransferProgress::TransferProgress(const std::string& label, std::uint64_t total)
    : label_(label), total_(total) {}

void TransferProgress::update(std::uint64_t sent, std::uint64_t total) {
    total_.store(total);
    // A retried transfer starts again from zero; the display holds its high-water mark
    std::uint64_t current = sent_.load();
    while (sent > current && !sent_.compare_exchange_weak(current, sent)) {
    }
}

std::shared_ptr<TransferProgress> ProgressBoard::track(const std::string& label, std::uint64_t total) {
    auto entry = std::make_shared<TransferProgress>(label, total);
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
    return entry;
}

std::vector<std::string> ProgressBoard::snapshot() {
    std::vector<std::shared_ptr<TransferProgress>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                      [](const std::weak_ptr<TransferProgress>& e) { return e.expired(); }),
                       entries_.end());
        for (const auto& entry : entries_) {
            if (auto locked = entry.lock()) {
                live.push_back(locked);
            }
        }
    }

    std::vector<std::string> lines;
    lines.reserve(live.size());
    for (const auto& entry : live) {
        lines.push_back(format(*entry));
    }
    return lines;
}

std::string ProgressBoard::format(const TransferProgress& progress) {
    const double mb = 1024.0 * 1024.0;
    std::uint64_t sent = progress.sent();
    std::uint64_t total = progress.total();
    int percent = total == 0 ? 100 : static_cast<int>((sent * 100) / total);

    std::ostringstream ss;
    ss << "Uploading " << progress.label() << ": "
       << std::fixed << std::setprecision(1) << (sent / mb) << " MB / " << (total / mb) << " MB ("
       << percent << "%)";
    return ss.str();
}

} // namespace reeldrop
