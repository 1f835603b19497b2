#pragma once

#include <memory>
#include <string>

#include "archive/IArchiveBackend.hpp"
#include "domain/CostCounters.hpp"
#include "domain/ObjectStore.hpp"

namespace archive {

// The post-2020 layout: raw/<YYYYMMDD>/<hh>/<country>/<testType>/*.jsonl.gz,
// each object a plain gzip stream of newline-delimited measurements.
class PartitionedBackend : public IArchiveBackend {
public:
    struct Layout {
        std::string bucket = "ooni-data-eu-fra";
        std::string prefix = "raw/";
        std::string suffix = ".jsonl.gz";
        domain::Date firstDate{2020, 10, 20};
    };

    explicit PartitionedBackend(std::shared_ptr<domain::IObjectStore> store);
    PartitionedBackend(std::shared_ptr<domain::IObjectStore> store, Layout layout);

    std::unique_ptr<FileEntryStream> listFiles(const domain::Date& first,
                                               const domain::Date& last,
                                               const std::string& testType,
                                               const std::string& country) override;

    domain::CostSnapshot costs() const override { return counters_.snapshot(); }

    const Layout& layout() const noexcept { return layout_; }

private:
    class Listing;
    class Measurements;

    std::unique_ptr<MeasurementStream> openMeasurements(std::string key);

    std::shared_ptr<domain::IObjectStore> store_;
    Layout layout_;
    domain::CostCounters counters_;
};

}  // namespace archive
