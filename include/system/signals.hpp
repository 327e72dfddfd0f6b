#pragma once

#include <atomic>

namespace fwfleet {

// Set by SIGINT/SIGTERM. Long running transfers poll it alongside their own
// per-attempt cancel flag.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested(const std::atomic_bool* attempt_cancel) {
    if (g_cancel.load(std::memory_order_relaxed)) return true;
    return attempt_cancel && attempt_cancel->load(std::memory_order_relaxed);
}

} // namespace fwfleet
