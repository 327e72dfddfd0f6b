#include "release/http_client.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <span>

namespace fwfleet {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

void GlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Shared by the write and progress callbacks of one transfer.
struct TransferCtx {
    IWriter* sink = nullptr;
    std::string* body = nullptr;
    std::size_t max_body = 0;
    bool overflow = false;
    Result sink_error = Result::Ok();

    const std::atomic_bool* cancel = nullptr;
    IProgress* progress = nullptr;
    const std::string* tag = nullptr;
    std::uint64_t received = 0;
};

size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const size_t n = size * nmemb;

    if (ctx->body) {
        if (ctx->body->size() + n > ctx->max_body) {
            ctx->overflow = true;
            return 0;
        }
        ctx->body->append(ptr, n);
    } else if (ctx->sink) {
        auto r = ctx->sink->WriteAll(
            std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), n));
        if (!r.ok) {
            ctx->sink_error = r;
            return 0;
        }
    }
    ctx->received += n;
    return n;
}

int XferInfoCb(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferCtx*>(clientp);
    if (CancelRequested(ctx->cancel)) return 1;

    if (ctx->progress && dlnow > 0) {
        ProgressEvent e{};
        e.component = ctx->tag ? std::string_view(*ctx->tag) : std::string_view();
        e.comp_done = static_cast<std::uint64_t>(dlnow);
        e.comp_total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0;
        ctx->progress->OnProgress(e);
    }
    return 0;
}

Result Perform(const HttpClient::Request& req,
               const std::string& user_agent,
               TransferCtx& ctx,
               long& http_status) {
    GlobalInit();
    http_status = 0;

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(Errc::SourceUnavailable, "curl_easy_init failed");

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    auto add_header = [&headers](const std::string& h) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (next) {
            (void)headers.release();
            headers.reset(next);
        }
    };
    if (!req.accept.empty()) add_header("Accept: " + req.accept);
    if (!req.bearer_token.empty()) add_header("Authorization: Bearer " + req.bearer_token);

    char errbuf[CURL_ERROR_SIZE]{};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, req.connect_timeout_seconds);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, req.timeout_seconds);
    // Abort stalled transfers: under 1 byte/s for 60 s.
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, 60L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, XferInfoCb);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    if (headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

    const CURLcode rc = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_status);

    if (rc == CURLE_OK) return Result::Ok();

    const std::string detail = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(rc);

    switch (rc) {
        case CURLE_ABORTED_BY_CALLBACK:
            return Result::Fail(Errc::Cancelled, "transfer cancelled: " + req.url);
        case CURLE_WRITE_ERROR:
            if (!ctx.sink_error.ok) return ctx.sink_error;
            if (ctx.overflow) {
                return Result::Fail(Errc::SourceUnavailable,
                                    "response too large: " + req.url);
            }
            break;
        case CURLE_HTTP_RETURNED_ERROR:
            if (http_status == 404) {
                return Result::Fail(Errc::NotFound, "HTTP 404: " + req.url);
            }
            return Result::Fail(Errc::SourceUnavailable,
                                "HTTP " + std::to_string(http_status) + ": " + req.url);
        case CURLE_OPERATION_TIMEDOUT:
            return Result::Fail(Errc::SourceUnavailable, "timed out: " + req.url + " (" + detail + ")");
        default:
            break;
    }
    return Result::Fail(Errc::SourceUnavailable, req.url + ": " + detail);
}

} // namespace

HttpClient::HttpClient() : user_agent_(std::string("fwfleet/1 ") + curl_version()) {}

Result HttpClient::Get(const Request& req, std::string& body, std::size_t max_body, long& http_status) const {
    body.clear();
    TransferCtx ctx;
    ctx.body = &body;
    ctx.max_body = max_body;
    ctx.cancel = req.cancel;
    ctx.tag = &req.tag;

    LogDebug("GET %s", req.url.c_str());
    return Perform(req, user_agent_, ctx, http_status);
}

Result HttpClient::Stream(const Request& req, IWriter& sink, long& http_status) const {
    TransferCtx ctx;
    ctx.sink = &sink;
    ctx.cancel = req.cancel;
    ctx.progress = req.progress;
    ctx.tag = &req.tag;

    LogDebug("GET (stream) %s", req.url.c_str());
    auto r = Perform(req, user_agent_, ctx, http_status);
    if (r.ok) {
        LogDebug("received %llu bytes from %s", (unsigned long long)ctx.received, req.url.c_str());
    }
    return r;
}

} // namespace fwfleet
