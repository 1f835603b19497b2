#pragma once

#include <map>
#include <optional>
#include <string>

#include "domain/ObjectStore.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::s3 {

// Anonymous S3 access over virtual-hosted HTTPS endpoints.
class S3ObjectStore : public domain::IObjectStore {
public:
    struct Config {
        // bucket -> host. Buckets not listed use <bucket>.s3.amazonaws.com.
        std::map<std::string, std::string> endpoints;
        infra::http::RequestOptions request{};
    };

    explicit S3ObjectStore(Config config);
    ~S3ObjectStore() override = default;

    domain::ListObjectsPage listObjects(const domain::ListObjectsRequest& request) override;

    std::string getObject(const std::string& bucket,
                          const std::string& key,
                          const std::optional<domain::ByteRange>& range = std::nullopt) override;

    std::string hostFor(const std::string& bucket) const;

    static std::string buildListTarget(const domain::ListObjectsRequest& request);
    static std::string buildObjectTarget(const std::string& key);

private:
    Config config_;
};

}  // namespace adapters::s3
