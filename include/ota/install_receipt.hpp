#pragma once

#include "util/result.hpp"

#include <string>

namespace fwfleet {

// Written beside an install target after a successful swap:
// <parent>/.<name>.receipt.json. Lets `verify` detect drift of the live tree
// without keeping the payload around.
struct InstallReceipt {
    std::string version;
    std::string payload_sha256;
    std::string tree_sha256;
    std::string installed_at;

    static std::string PathFor(const std::string& target_dir);

    // tmp + fsync + rename. NotFound from Load when no receipt exists.
    static Result Write(const std::string& path, const InstallReceipt& receipt);
    static Result Load(const std::string& path, InstallReceipt& out);
};

} // namespace fwfleet
