#include "util/result.hpp"

namespace fwfleet {

const char* ToString(Errc code) {
    switch (code) {
        case Errc::Ok:                  return "ok";
        case Errc::Io:                  return "io-error";
        case Errc::InvalidArgument:     return "invalid-argument";
        case Errc::Cancelled:           return "cancelled";
        case Errc::NotFound:            return "not-found";
        case Errc::SourceUnavailable:   return "source-unavailable";
        case Errc::NoAssetFound:        return "no-asset-found";
        case Errc::ChecksumUnavailable: return "checksum-unavailable";
        case Errc::ChecksumMismatch:    return "checksum-mismatch";
        case Errc::InstallFailed:       return "install-failed";
        case Errc::StoreUnavailable:    return "store-unavailable";
    }
    return "unknown";
}

} // namespace fwfleet
