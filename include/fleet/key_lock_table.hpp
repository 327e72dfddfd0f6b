#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace fwfleet {

// One mutex per (device, component). Entries live as long as the table; the
// key space is the roster times the tracked components.
class KeyLockTable {
public:
    std::unique_lock<std::mutex> Acquire(const std::string& device, const std::string& component);

private:
    std::mutex mu_;
    std::map<std::pair<std::string, std::string>, std::unique_ptr<std::mutex>> locks_;
};

} // namespace fwfleet
