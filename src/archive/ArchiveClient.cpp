#include "archive/ArchiveClient.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <utility>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace archive {

namespace {

class ConcatenatedListing : public FileEntryStream {
public:
    ConcatenatedListing(std::unique_ptr<FileEntryStream> head, std::function<std::unique_ptr<FileEntryStream>()> tail)
        : current_(std::move(head)), tail_(std::move(tail)) {}

    // A listing failure of the head ends only the head. The tail is still
    // listed and the head's error is rethrown once the tail is exhausted.
    std::optional<FileEntry> next() override {
        while (current_) {
            try {
                if (auto entry = current_->next()) {
                    return entry;
                }
            } catch (const domain::ListingError& ex) {
                if (!tail_) {
                    throw;
                }
                LOG_WARN("Listing failed, continuing with the next archive: " << ex.what());
                deferred_ = std::current_exception();
            }
            current_.reset();
            if (tail_) {
                current_ = tail_();
                tail_ = nullptr;
            }
        }
        if (deferred_) {
            auto error = deferred_;
            deferred_ = nullptr;
            std::rethrow_exception(error);
        }
        return std::nullopt;
    }

private:
    std::unique_ptr<FileEntryStream> current_;
    std::function<std::unique_ptr<FileEntryStream>()> tail_;
    std::exception_ptr deferred_;
};

}  // namespace

ArchiveClient::ArchiveClient(std::shared_ptr<domain::IObjectStore> store)
    : ArchiveClient(std::move(store), LegacyArchiveBackend::Layout{}, PartitionedBackend::Layout{}) {}

ArchiveClient::ArchiveClient(std::shared_ptr<domain::IObjectStore> store,
                             LegacyArchiveBackend::Layout legacyLayout,
                             PartitionedBackend::Layout partitionedLayout)
    : legacy_(store, std::move(legacyLayout)), partitioned_(store, std::move(partitionedLayout)) {}

std::unique_ptr<FileEntryStream> ArchiveClient::listFiles(const domain::Date& first,
                                                          const domain::Date& last,
                                                          const std::string& testType,
                                                          const std::string& country) {
    auto* partitioned = &partitioned_;
    return std::make_unique<ConcatenatedListing>(
        legacy_.listFiles(first, last, testType, country),
        [partitioned, first, last, testType, country]() {
            return partitioned->listFiles(first, last, testType, country);
        });
}

domain::CostSnapshot ArchiveClient::costs() const {
    auto total = legacy_.costs();
    total += partitioned_.costs();
    return total;
}

}  // namespace archive
