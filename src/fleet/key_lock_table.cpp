#include "fleet/key_lock_table.hpp"

namespace fwfleet {

std::unique_lock<std::mutex> KeyLockTable::Acquire(const std::string& device, const std::string& component) {
    std::mutex* m = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& slot = locks_[{device, component}];
        if (!slot) slot = std::make_unique<std::mutex>();
        m = slot.get();
    }
    return std::unique_lock<std::mutex>(*m);
}

} // namespace fwfleet
