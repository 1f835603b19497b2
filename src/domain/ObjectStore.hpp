#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {

struct ObjectSummary {
    std::string key;
    std::uint64_t size{0};
};

struct ListObjectsRequest {
    std::string bucket;
    std::string prefix;
    std::string delimiter;
    std::string startAfter;
    std::string continuationToken;
};

struct ListObjectsPage {
    std::string bucket;
    std::vector<std::string> commonPrefixes;
    std::vector<ObjectSummary> objects;
    bool truncated{false};
    std::string nextContinuationToken;
};

// Inclusive on both ends, like the HTTP Range header.
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    std::uint64_t size() const { return last - first + 1; }
};

class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    // One page of a ListObjectsV2 call. Throws ListingError.
    virtual ListObjectsPage listObjects(const ListObjectsRequest& request) = 0;

    // Whole object, or the requested byte range of it. Throws FetchError.
    virtual std::string getObject(const std::string& bucket,
                                  const std::string& key,
                                  const std::optional<ByteRange>& range = std::nullopt) = 0;
};

}  // namespace domain
