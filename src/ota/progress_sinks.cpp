#include "ota/progress_sinks.hpp"

#include "util/logger.hpp"

namespace fwfleet {

void LogProgressSink::OnProgress(const ProgressEvent& e) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string key(e.component);
    const bool done = e.comp_total > 0 && e.comp_done >= e.comp_total;
    auto& next = next_[key];
    if (!done && e.comp_done < next) return;
    if (done) {
        next_.erase(key);
    } else {
        next = e.comp_done + min_step_;
    }

    if (e.comp_total > 0) {
        int pct = static_cast<int>((e.comp_done * 100ULL) / e.comp_total);
        if (pct > 100) pct = 100;
        LogInfo("[%.*s %d%%] %llu/%llu",
                (int)e.component.size(), e.component.data(),
                pct,
                (unsigned long long)e.comp_done,
                (unsigned long long)e.comp_total);
    } else {
        LogInfo("[%.*s] %llu bytes",
                (int)e.component.size(), e.component.data(),
                (unsigned long long)e.comp_done);
    }
}

} // namespace fwfleet
