#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace infra::http {

struct TlsOptions {
    bool verifyPeer = true;
    // PEM bundle. Empty means the system default verify paths.
    std::string caFile;
};

struct RequestOptions {
    int timeoutSec = 30;
    TlsOptions tls{};
    std::vector<std::pair<std::string, std::string>> headers{};
    std::uint64_t bodyLimit = 1ULL << 30;
};

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string content_range_header;
    std::string final_host;
    std::string final_target;
};

// Performs an HTTPS GET, following up to 5 redirects, and returns whatever
// status the server answered with. host may carry a ":port" suffix.
// Throws std::runtime_error on network and TLS errors.
HttpResponse https_get_response(const std::string& host, const std::string& target, const RequestOptions& options);

}  // namespace infra::http
