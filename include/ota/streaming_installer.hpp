#pragma once

#include "crypto/integrity_verifier.hpp"
#include "ota/installer.hpp"
#include "ota/staging.hpp"
#include "ota/swap_ops.hpp"
#include "release/asset_downloader.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace fwfleet {

// Stage-then-swap installer. All scratch paths are siblings of the target so
// every rename stays on one filesystem:
//   .<name>.download-XXXXXX   payload being downloaded
//   .<name>.staging-XXXXXX    extracted tree awaiting the swap
//   .<name>.previous-XXXXXX   old tree while a non-atomic swap is in flight
class StreamingInstaller final : public IInstaller {
  public:
    struct Options {
        bool require_checksum = true;
        std::size_t strip_components = 1;
        long download_timeout_seconds = 600;
        IProgress* progress_sink = nullptr;
    };

    StreamingInstaller(std::shared_ptr<IAssetDownloader> downloader,
                       Options opt,
                       std::shared_ptr<const ISwapOps> swap_ops = DefaultSwapOps());

    Result Install(const InstallRequest& req, InstallOutcome& out) override;

  private:
    Result Download(const InstallRequest& req,
                    const std::string& parent,
                    const std::string& name,
                    TempFile& out_file,
                    InstallOutcome& out) const;
    Result Extract(const InstallRequest& req,
                   const std::string& payload_path,
                   const std::string& staging_dir,
                   InstallOutcome& out) const;
    Result RemoveReceipt(const std::string& receipt_path, const std::string& parent) const;
    Result Swap(StagingDir& staging,
                const std::string& target_dir,
                const std::string& parent,
                const std::string& name) const;
    void RecoverInterrupted(const std::string& parent,
                            const std::string& name,
                            const std::string& target_dir) const;

    std::shared_ptr<IAssetDownloader> downloader_;
    Options opt_;
    std::shared_ptr<const ISwapOps> swap_ops_;
    IntegrityVerifier verifier_;
};

} // namespace fwfleet
