#include "ota/tar_stream_extractor.hpp"

#include "ota/archive_path_policy.hpp"
#include "ota/tar_stream_reader_adapter.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace fwfleet {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

Result Fail(archive* a, const char* what, const std::atomic_bool* cancel) {
    if (CancelRequested(cancel)) {
        return Result::Fail(Errc::Cancelled, "extraction cancelled");
    }
    return Result::Fail(Errc::InstallFailed, std::string(what) + ": " + ArchiveErr(a));
}

} // namespace

Result TarStreamExtractor::ExtractToDir(IReader& tar_stream,
                                        const std::string& dst_dir,
                                        std::string_view tag,
                                        Stats* stats) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(Errc::InstallFailed, "Destination is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(Errc::InstallFailed, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (OpenArchiveFromReader(ar.get(), tar_stream, opt_.cancel) != ARCHIVE_OK) {
        return Fail(ar.get(), "archive_read_open2", opt_.cancel);
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(Errc::InstallFailed, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    const ArchivePathPolicy path_policy(opt_.safe_paths_only, opt_.strip_components);

    Stats local{};
    std::uint64_t next_progress = opt_.progress_interval_bytes;

    auto emit_progress = [&](bool final) {
        if (!opt_.progress_sink) return;
        if (!final && (opt_.progress_interval_bytes == 0 || local.bytes < next_progress)) return;
        next_progress = local.bytes + opt_.progress_interval_bytes;
        ProgressEvent event{};
        event.component = tag;
        event.comp_done = local.bytes;
        event.comp_total = final ? local.bytes : 0;
        opt_.progress_sink->OnProgress(event);
    };

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) return Fail(ar.get(), "archive_read_next_header", opt_.cancel);

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry); hardlink && *hardlink) {
            std::string rel_hl;
            auto hl_res = path_policy.NormalizeHardlinkPath(hardlink, rel_hl);
            if (!hl_res.is_ok()) return hl_res;
            if (rel_hl.empty()) {
                return Result::Fail(Errc::InstallFailed,
                                    std::string("hardlink target stripped away: ") + hardlink);
            }
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("[%.*s] entry: %s", (int)tag.size(), tag.data(), rel.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK && wh != ARCHIVE_WARN) return Fail(aw.get(), "archive_write_header", opt_.cancel);

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK && rr != ARCHIVE_WARN) return Fail(ar.get(), "archive_read_data_block", opt_.cancel);

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww < ARCHIVE_OK) return Fail(aw.get(), "archive_write_data_block", opt_.cancel);

            local.bytes += static_cast<std::uint64_t>(size);
            emit_progress(false);
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK && wf != ARCHIVE_WARN) return Fail(aw.get(), "archive_write_finish_entry", opt_.cancel);
        ++local.entries;
    }

    // Applies deferred directory permissions and times.
    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Fail(aw.get(), "archive_write_close", opt_.cancel);
    }

    emit_progress(true);
    if (stats) *stats = local;
    return Result::Ok();
}

} // namespace fwfleet
