#include "ota/tar_stream_reader_adapter.hpp"

#include "system/signals.hpp"

#include <cerrno>
#include <vector>

namespace fwfleet {

namespace {

struct ReaderCtx {
    IReader* reader = nullptr;
    const std::atomic_bool* cancel = nullptr;
    std::vector<std::uint8_t> buffer;

    ReaderCtx(IReader& in, const std::atomic_bool* c, size_t buffer_size = 64 * 1024)
        : reader(&in), cancel(c), buffer(buffer_size) {}
};

la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ReaderCtx*>(client_data);
    if (CancelRequested(ctx->cancel)) {
        archive_set_error(ar, EINTR, "extraction cancelled");
        return -1;
    }

    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) {
        archive_set_error(ar, EIO, "payload read failed");
        return -1;
    }

    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

int CloseCb(struct archive*, void* client_data) {
    delete static_cast<ReaderCtx*>(client_data);
    return ARCHIVE_OK;
}

} // namespace

int OpenArchiveFromReader(struct archive* ar, IReader& reader, const std::atomic_bool* cancel) {
    auto* ctx = new ReaderCtx(reader, cancel);
    // ctx now belongs to libarchive: CloseCb frees it on failure or on archive_read_free.
    return archive_read_open2(ar, ctx, nullptr, ReadCb, nullptr, CloseCb);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace fwfleet
