#pragma once

#include "io/io.hpp"
#include "ota/progress.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <string>

namespace fwfleet {

// Minimal blocking HTTPS client on libcurl. One easy handle per request, so a
// single instance can be shared by worker threads.
class HttpClient {
  public:
    struct Request {
        std::string url;
        std::string bearer_token;
        std::string accept;
        long timeout_seconds = 30;
        long connect_timeout_seconds = 15;
        const std::atomic_bool* cancel = nullptr;
        IProgress* progress = nullptr;
        std::string tag;
    };

    HttpClient();

    // Buffers at most |max_body| bytes. HTTP 404 => NotFound, other HTTP
    // errors and transport failures => SourceUnavailable.
    Result Get(const Request& req, std::string& body, std::size_t max_body, long& http_status) const;

    // Streams the body into |sink| as it arrives.
    Result Stream(const Request& req, IWriter& sink, long& http_status) const;

  private:
    std::string user_agent_;
};

} // namespace fwfleet
