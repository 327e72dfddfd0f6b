#pragma once

#include "ota/progress.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fwfleet {

// Logs transfer progress through the logger at most once per |min_step_bytes|.
// Safe to share between worker threads; each event is logged under its own
// component tag.
class LogProgressSink final : public IProgress {
public:
    explicit LogProgressSink(std::uint64_t min_step_bytes = 4 * 1024 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::uint64_t min_step_ = 0;
    std::mutex mu_;
    std::unordered_map<std::string, std::uint64_t> next_;
};

} // namespace fwfleet
