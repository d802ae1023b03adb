#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace reeldrop {

// Counters for one running transfer. update() never blocks and sent() never decreases.
class TransferProgress {
public:
    TransferProgress(const std::string& label, std::uint64_t total);

    void update(std::uint64_t sent, std::uint64_t total);

    const std::string& label() const { return label_; }
    std::uint64_t sent() const { return sent_.load(); }
    std::uint64_t total() const { return total_.load(); }

private:
    std::string label_;
    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> total_{0};
};

/**
 * Display side channel for upload progress. Workflows hold a TransferProgress
 * for the duration of a transfer; the event loop calls snapshot() on a timer.
 * An entry disappears once its holder releases it.
 */
class ProgressBoard {
public:
    std::shared_ptr<TransferProgress> track(const std::string& label, std::uint64_t total);

    // One formatted line per live transfer
    std::vector<std::string> snapshot();

    static std::string format(const TransferProgress& progress);

private:
    std::mutex mutex_;
    std::vector<std::weak_ptr<TransferProgress>> entries_;
};

} // namespace reeldrop
