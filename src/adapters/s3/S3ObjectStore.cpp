#include "adapters/s3/S3ObjectStore.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "adapters/s3/ListBucketResultXml.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::s3 {
namespace {

bool isUnreserved(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

std::string percentEncode(const std::string& value, bool keepSlash) {
    std::string encoded;
    encoded.reserve(value.size());
    for (const char raw : value) {
        const auto ch = static_cast<unsigned char>(raw);
        if (isUnreserved(ch) || (keepSlash && ch == '/')) {
            encoded.push_back(raw);
            continue;
        }
        char buffer[4];
        std::snprintf(buffer, sizeof(buffer), "%%%02X", static_cast<unsigned>(ch));
        encoded.append(buffer);
    }
    return encoded;
}

void appendParam(std::ostringstream& target, const char* name, const std::string& value) {
    if (value.empty()) {
        return;
    }
    target << '&' << name << '=' << percentEncode(value, false);
}

std::string describe(const std::string& bucket, const std::string& key) {
    return "s3://" + bucket + "/" + key;
}

}  // namespace

S3ObjectStore::S3ObjectStore(Config config) : config_(std::move(config)) {}

std::string S3ObjectStore::hostFor(const std::string& bucket) const {
    if (auto it = config_.endpoints.find(bucket); it != config_.endpoints.end()) {
        return it->second;
    }
    return bucket + ".s3.amazonaws.com";
}

std::string S3ObjectStore::buildListTarget(const domain::ListObjectsRequest& request) {
    std::ostringstream target;
    target << "/?list-type=2";
    appendParam(target, "continuation-token", request.continuationToken);
    appendParam(target, "delimiter", request.delimiter);
    appendParam(target, "prefix", request.prefix);
    appendParam(target, "start-after", request.startAfter);
    return target.str();
}

std::string S3ObjectStore::buildObjectTarget(const std::string& key) {
    return "/" + percentEncode(key, true);
}

domain::ListObjectsPage S3ObjectStore::listObjects(const domain::ListObjectsRequest& request) {
    const auto host = hostFor(request.bucket);
    const auto target = buildListTarget(request);
    LOG_DEBUG("S3 LIST https://" << host << target);

    infra::http::HttpResponse response;
    try {
        response = infra::http::https_get_response(host, target, config_.request);
    } catch (const std::exception& ex) {
        throw domain::ListingError(ex.what());
    }
    if (response.status != 200U) {
        std::ostringstream oss;
        oss << "Listing of " << describe(request.bucket, request.prefix) << " returned HTTP " << response.status;
        throw domain::ListingError(oss.str());
    }

    auto page = parseListBucketResult(response.body);
    if (page.bucket.empty()) {
        page.bucket = request.bucket;
    }
    return page;
}

std::string S3ObjectStore::getObject(const std::string& bucket,
                                     const std::string& key,
                                     const std::optional<domain::ByteRange>& range) {
    const auto host = hostFor(bucket);
    const auto target = buildObjectTarget(key);

    auto options = config_.request;
    if (range) {
        if (range->last < range->first) {
            throw domain::FetchError("Invalid byte range for " + describe(bucket, key));
        }
        options.headers.emplace_back("Range",
                                     "bytes=" + std::to_string(range->first) + "-" + std::to_string(range->last));
        LOG_DEBUG("S3 GET " << describe(bucket, key) << " bytes=" << range->first << "-" << range->last);
    } else {
        LOG_DEBUG("S3 GET " << describe(bucket, key));
    }

    infra::http::HttpResponse response;
    try {
        response = infra::http::https_get_response(host, target, options);
    } catch (const std::exception& ex) {
        throw domain::FetchError(ex.what());
    }

    const unsigned expected = range ? 206U : 200U;
    if (response.status != expected) {
        std::ostringstream oss;
        oss << "GET " << describe(bucket, key);
        if (range) {
            oss << " bytes=" << range->first << "-" << range->last;
        }
        if (range && response.status == 200U) {
            oss << " ignored the Range header";
        } else {
            oss << " returned HTTP " << response.status;
        }
        throw domain::FetchError(oss.str(), response.status);
    }
    if (range && response.body.size() != range->size()) {
        std::ostringstream oss;
        oss << "GET " << describe(bucket, key) << " bytes=" << range->first << "-" << range->last << " returned "
            << response.body.size() << " bytes (Content-Range: " << response.content_range_header << ")";
        throw domain::FetchError(oss.str(), response.status);
    }
    return std::move(response.body);
}

}  // namespace adapters::s3
