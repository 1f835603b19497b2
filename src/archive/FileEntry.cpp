#include "archive/FileEntry.hpp"

#include <stdexcept>
#include <utility>

namespace archive {

FileEntry::FileEntry(std::string testType,
                     std::string country,
                     domain::Date date,
                     FileLocation location,
                     std::uint64_t sizeBytes,
                     Materializer materializer)
    : testType_(std::move(testType)),
      country_(std::move(country)),
      date_(date),
      location_(std::move(location)),
      sizeBytes_(sizeBytes),
      materializer_(std::move(materializer)) {}

std::unique_ptr<MeasurementStream> FileEntry::getMeasurements() const {
    if (!materializer_) {
        throw std::logic_error("File entry " + describe() + " has no materializer");
    }
    return materializer_();
}

std::string FileEntry::describe() const {
    return location_.url() + " (" + testType_ + "/" + country_ + "/" + date_.toIso() + ")";
}

bool operator==(const FileEntry& lhs, const FileEntry& rhs) {
    return lhs.testType() == rhs.testType() && lhs.country() == rhs.country() && lhs.date() == rhs.date() &&
           lhs.location().bucket == rhs.location().bucket && lhs.location().key == rhs.location().key &&
           lhs.sizeBytes() == rhs.sizeBytes();
}

}  // namespace archive
