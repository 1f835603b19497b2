#pragma once

#include <memory>
#include <string>

#include "archive/IArchiveBackend.hpp"
#include "archive/IndexModel.hpp"
#include "domain/CostCounters.hpp"
#include "domain/ObjectStore.hpp"

namespace archive {

// The 2012-2020 "autoclaved" layout: per-day directories of tar.lz4 and
// json.lz4 files, described by <day>/index.json.gz. Records are pulled out
// of the archives with ranged GETs over merged frame runs.
class LegacyArchiveBackend : public IArchiveBackend {
public:
    struct Layout {
        std::string bucket = "ooni-data";
        std::string prefix = "autoclaved/jsonl.tar.lz4/";
        std::string indexName = "index.json.gz";
        domain::Date lastDate{2020, 10, 21};
    };

    explicit LegacyArchiveBackend(std::shared_ptr<domain::IObjectStore> store);
    LegacyArchiveBackend(std::shared_ptr<domain::IObjectStore> store, Layout layout);

    std::unique_ptr<FileEntryStream> listFiles(const domain::Date& first,
                                               const domain::Date& last,
                                               const std::string& testType,
                                               const std::string& country) override;

    domain::CostSnapshot costs() const override { return counters_.snapshot(); }

    const Layout& layout() const noexcept { return layout_; }

private:
    class Listing;
    class Measurements;

    std::unique_ptr<MeasurementStream> openMeasurements(std::string key, std::shared_ptr<const IndexFile> file);

    std::shared_ptr<domain::IObjectStore> store_;
    Layout layout_;
    domain::CostCounters counters_;
};

}  // namespace archive
