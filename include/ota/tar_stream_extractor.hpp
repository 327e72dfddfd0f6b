#pragma once

#include "io/io.hpp"
#include "ota/progress.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fwfleet {

class TarStreamExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        std::size_t strip_components = 1;
        const std::atomic_bool* cancel = nullptr;

        IProgress* progress_sink = nullptr;
        std::uint64_t progress_interval_bytes = 4 * 1024 * 1024ULL;
    };

    struct Stats {
        std::uint64_t entries = 0;
        std::uint64_t bytes = 0;
    };

    TarStreamExtractor() = default;
    explicit TarStreamExtractor(const Options& opt) : opt_(opt) {}

    // Extracts a tar stream (any compression libarchive recognizes) into an
    // existing directory, overwriting files already there. Failures carry
    // Errc::InstallFailed or Errc::Cancelled.
    Result ExtractToDir(IReader& tar_stream,
                        const std::string& dst_dir,
                        std::string_view tag,
                        Stats* stats = nullptr) const;

  private:
    Options opt_{};
};

} // namespace fwfleet
