#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/json/value.hpp>

#include "domain/Date.hpp"

namespace archive {

struct FileLocation {
    std::string bucket;
    std::string key;

    std::string url() const { return "s3://" + bucket + "/" + key; }
};

// Pull stream of parsed measurements for one file entry.
class MeasurementStream {
public:
    virtual ~MeasurementStream() = default;

    // Next measurement, or std::nullopt when exhausted. Throws
    // domain::FetchError or domain::DecodeError; after a DecodeError the
    // stream may be pulled again to continue with the records that were
    // not affected.
    virtual std::optional<boost::json::value> next() = 0;
};

// One remote object holding records of interest. The materializer refers
// to the backend that listed the entry; the backend must outlive it.
class FileEntry {
public:
    using Materializer = std::function<std::unique_ptr<MeasurementStream>()>;

    FileEntry(std::string testType,
              std::string country,
              domain::Date date,
              FileLocation location,
              std::uint64_t sizeBytes,
              Materializer materializer);

    const std::string& testType() const noexcept { return testType_; }
    const std::string& country() const noexcept { return country_; }
    const domain::Date& date() const noexcept { return date_; }
    const FileLocation& location() const noexcept { return location_; }
    std::uint64_t sizeBytes() const noexcept { return sizeBytes_; }

    // Every call issues its own requests.
    std::unique_ptr<MeasurementStream> getMeasurements() const;

    // "<url> (<testType>/<country>/<date>)", for error reports.
    std::string describe() const;

private:
    std::string testType_;
    std::string country_;
    domain::Date date_;
    FileLocation location_;
    std::uint64_t sizeBytes_;
    Materializer materializer_;
};

// Listing identity; the materializer is not compared.
bool operator==(const FileEntry& lhs, const FileEntry& rhs);
inline bool operator!=(const FileEntry& lhs, const FileEntry& rhs) { return !(lhs == rhs); }

// Pull stream of listed entries, in date order. Exhausted once it returns
// std::nullopt; list again to restart.
class FileEntryStream {
public:
    virtual ~FileEntryStream() = default;
    virtual std::optional<FileEntry> next() = 0;
};

}  // namespace archive
