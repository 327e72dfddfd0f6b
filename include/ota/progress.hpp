#pragma once
#include <cstdint>
#include <string_view>

namespace fwfleet {

struct ProgressEvent {
    std::string_view component;
    std::uint64_t comp_done = 0;
    std::uint64_t comp_total = 0; // 0 => unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace fwfleet
