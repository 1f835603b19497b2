#pragma once

#include <memory>
#include <string>

#include "archive/FileEntry.hpp"
#include "domain/CostCounters.hpp"
#include "domain/Date.hpp"

namespace archive {

class IArchiveBackend {
public:
    virtual ~IArchiveBackend() = default;

    // Lazily lists entries with records of testType from country between
    // first and last (inclusive). Dates outside the backend's coverage
    // window yield nothing. No request is issued until the stream is pulled.
    virtual std::unique_ptr<FileEntryStream> listFiles(const domain::Date& first,
                                                       const domain::Date& last,
                                                       const std::string& testType,
                                                       const std::string& country) = 0;

    virtual domain::CostSnapshot costs() const = 0;
};

}  // namespace archive
