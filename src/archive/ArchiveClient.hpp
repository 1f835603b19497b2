#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "archive/FileEntry.hpp"
#include "archive/LegacyArchiveBackend.hpp"
#include "archive/PartitionedBackend.hpp"
#include "domain/CostCounters.hpp"
#include "domain/Date.hpp"
#include "domain/ObjectStore.hpp"

namespace archive {

// Both archive layouts behind one listing. Legacy dates all precede the
// partitioned ones, so listing one backend after the other keeps date order.
class ArchiveClient {
public:
    explicit ArchiveClient(std::shared_ptr<domain::IObjectStore> store);
    ArchiveClient(std::shared_ptr<domain::IObjectStore> store,
                  LegacyArchiveBackend::Layout legacyLayout,
                  PartitionedBackend::Layout partitionedLayout);

    ArchiveClient(const ArchiveClient&) = delete;
    ArchiveClient& operator=(const ArchiveClient&) = delete;

    // The partitioned listing is only started once the legacy one is
    // exhausted.
    std::unique_ptr<FileEntryStream> listFiles(const domain::Date& first,
                                               const domain::Date& last,
                                               const std::string& testType,
                                               const std::string& country);

    std::uint64_t bytesDownloaded() const { return costs().bytesDownloaded; }
    std::uint64_t listRequests() const { return costs().listRequests; }
    std::uint64_t getRequests() const { return costs().getRequests; }
    double estimatedCostUsd() const { return costs().estimatedCostUsd(); }

    domain::CostSnapshot costs() const;

private:
    LegacyArchiveBackend legacy_;
    PartitionedBackend partitioned_;
};

}  // namespace archive
