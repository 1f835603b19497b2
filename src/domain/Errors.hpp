#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace domain {

class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Listing page could not be obtained or understood.
class ListingError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

// Malformed legacy index; fatal for the date prefix being read.
class IndexParseError : public ArchiveError {
public:
    IndexParseError(const std::string& message, std::size_t lineNumber)
        : ArchiveError("index line " + std::to_string(lineNumber) + ": " + message), lineNumber_(lineNumber) {}

    std::size_t lineNumber() const noexcept { return lineNumber_; }

private:
    std::size_t lineNumber_;
};

// GET failed at the transport or HTTP level. When a ranged GET of one
// segment fails, lostRecords counts the records that segment held.
class FetchError : public ArchiveError {
public:
    FetchError(const std::string& message, unsigned httpStatus = 0U, std::size_t lostRecords = 0)
        : ArchiveError(message), httpStatus_(httpStatus), lostRecords_(lostRecords) {}

    unsigned httpStatus() const noexcept { return httpStatus_; }
    std::size_t lostRecords() const noexcept { return lostRecords_; }

private:
    unsigned httpStatus_;
    std::size_t lostRecords_;
};

// Decompression or record extraction failed. lostRecords counts the records
// scheduled after the failure that could not be recovered from the fetch.
class DecodeError : public ArchiveError {
public:
    DecodeError(const std::string& message, std::size_t lostRecords = 0)
        : ArchiveError(message), lostRecords_(lostRecords) {}

    std::size_t lostRecords() const noexcept { return lostRecords_; }

private:
    std::size_t lostRecords_;
};

}  // namespace domain
