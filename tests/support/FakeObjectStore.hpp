#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/ObjectStore.hpp"

namespace testsupport {

// In-memory bucket set with ListObjectsV2 paging semantics. Records every
// request it serves.
class FakeObjectStore : public domain::IObjectStore {
public:
    struct GetCall {
        std::string bucket;
        std::string key;
        std::optional<domain::ByteRange> range;
    };

    explicit FakeObjectStore(std::size_t pageSize = 1000) : pageSize_(pageSize) {}

    void put(const std::string& bucket, const std::string& key, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        buckets_[bucket][key] = std::move(body);
    }

    void failGet(const std::string& key, unsigned status = 500) {
        std::lock_guard<std::mutex> lock(mutex_);
        failingGets_[key] = status;
    }

    // Fails only ranged GETs of key starting at firstByte.
    void failRange(const std::string& key, std::uint64_t firstByte, unsigned status = 500) {
        std::lock_guard<std::mutex> lock(mutex_);
        failingRanges_[{key, firstByte}] = status;
    }

    // Pages keep their truncated flag but lose the continuation token.
    void dropContinuationTokens() {
        std::lock_guard<std::mutex> lock(mutex_);
        dropTokens_ = true;
    }

    void failList(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        failingLists_.insert(prefix);
    }

    domain::ListObjectsPage listObjects(const domain::ListObjectsRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lists_.push_back(request);
        if (failingLists_.count(request.prefix) != 0) {
            throw domain::ListingError("list " + request.prefix + " failed: HTTP 503");
        }

        domain::ListObjectsPage page;
        page.bucket = request.bucket;
        const auto bucket = buckets_.find(request.bucket);
        if (bucket == buckets_.end()) {
            return page;
        }

        // Keys and rolled-up prefixes in lexicographic order, as S3 returns them.
        std::map<std::string, std::optional<std::uint64_t>> items;
        for (const auto& [key, body] : bucket->second) {
            if (key.compare(0, request.prefix.size(), request.prefix) != 0) {
                continue;
            }
            if (!request.startAfter.empty() && key <= request.startAfter) {
                continue;
            }
            if (!request.delimiter.empty()) {
                const auto pos = key.find(request.delimiter, request.prefix.size());
                if (pos != std::string::npos) {
                    const auto common = key.substr(0, pos + request.delimiter.size());
                    if (request.startAfter.empty() || common > request.startAfter) {
                        items.emplace(common, std::nullopt);
                    }
                    continue;
                }
            }
            items.emplace(key, body.size());
        }

        auto it = items.begin();
        if (!request.continuationToken.empty()) {
            it = items.upper_bound(request.continuationToken);
        }
        std::size_t served = 0;
        for (; it != items.end() && served < pageSize_; ++it, ++served) {
            if (it->second) {
                page.objects.push_back(domain::ObjectSummary{it->first, *it->second});
            } else {
                page.commonPrefixes.push_back(it->first);
            }
            page.nextContinuationToken = it->first;
        }
        page.truncated = it != items.end();
        if (!page.truncated || dropTokens_) {
            page.nextContinuationToken.clear();
        }
        return page;
    }

    std::string getObject(const std::string& bucket,
                          const std::string& key,
                          const std::optional<domain::ByteRange>& range = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        gets_.push_back(GetCall{bucket, key, range});
        if (const auto failing = failingGets_.find(key); failing != failingGets_.end()) {
            throw domain::FetchError("GET " + key + " failed with HTTP " + std::to_string(failing->second),
                                     failing->second);
        }
        if (range) {
            if (const auto failing = failingRanges_.find({key, range->first}); failing != failingRanges_.end()) {
                throw domain::FetchError("GET " + key + " bytes=" + std::to_string(range->first) +
                                             " failed with HTTP " + std::to_string(failing->second),
                                         failing->second);
            }
        }
        const auto b = buckets_.find(bucket);
        if (b == buckets_.end() || b->second.find(key) == b->second.end()) {
            throw domain::FetchError("GET " + key + ": NoSuchKey", 404);
        }
        const auto& body = b->second.at(key);
        if (!range) {
            return body;
        }
        if (range->first >= body.size() || range->last < range->first) {
            throw domain::FetchError("GET " + key + ": InvalidRange", 416);
        }
        const auto last = std::min<std::uint64_t>(range->last, body.size() - 1);
        return body.substr(static_cast<std::size_t>(range->first),
                           static_cast<std::size_t>(last - range->first + 1));
    }

    std::vector<domain::ListObjectsRequest> lists() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lists_;
    }

    std::vector<GetCall> gets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return gets_;
    }

    void clearCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        lists_.clear();
        gets_.clear();
    }

private:
    const std::size_t pageSize_;
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::string>> buckets_;
    std::map<std::string, unsigned> failingGets_;
    std::map<std::pair<std::string, std::uint64_t>, unsigned> failingRanges_;
    std::set<std::string> failingLists_;
    bool dropTokens_ = false;
    std::vector<domain::ListObjectsRequest> lists_;
    std::vector<GetCall> gets_;
};

}  // namespace testsupport
