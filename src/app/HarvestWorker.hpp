#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "domain/CostCounters.hpp"
#include "domain/Date.hpp"

namespace harvest::common {
struct Config;
}

namespace archive {
class ArchiveClient;
class FileEntry;
}  // namespace archive

namespace app {

// Downloads every listed entry into
// <outputDir>/<country>/<YYYY-MM-DD>/<name>.jsonl.gz, one trimmed
// measurement per line, until the listing ends or a stop condition hits.
class HarvestWorker {
public:
    struct Options {
        std::string country;
        domain::Date firstDate;
        domain::Date lastDate;
        std::string testType;
        std::size_t maxStringSize = 1000;
        double costLimitUsd = 1.00;
        std::string outputDir;
        std::size_t concurrency = 1;
        std::size_t limit = 0;

        static Options fromConfig(const harvest::common::Config& config);
    };

    struct Summary {
        std::size_t entriesOk = 0;
        std::size_t entriesFailed = 0;
        std::size_t entriesSkipped = 0;
        std::uint64_t recordsWritten = 0;
        std::uint64_t recordsLost = 0;
        std::uint64_t membersTrimmed = 0;
        bool costLimitHit = false;
        domain::CostSnapshot costs;
    };

    HarvestWorker(archive::ArchiveClient& client, Options options);

    Summary run();

    // "2017-01-01/20170101T000000Z-KZ-AS9198-web_connectivity-...-probe.json.lz4"
    // -> "20170101T000000Z-KZ-AS9198-web_connectivity-...-probe.jsonl.gz".
    static std::string outputName(const std::string& key);
    std::string outputPath(const archive::FileEntry& entry) const;

private:
    void harvestEntry_(const archive::FileEntry& entry);
    bool costLimitReached_() const;

    archive::ArchiveClient& client_;
    const Options options_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> costLimitHit_{false};
    std::atomic<std::size_t> entriesOk_{0};
    std::atomic<std::size_t> entriesFailed_{0};
    std::atomic<std::size_t> entriesSkipped_{0};
    std::atomic<std::uint64_t> recordsWritten_{0};
    std::atomic<std::uint64_t> recordsLost_{0};
    std::atomic<std::uint64_t> membersTrimmed_{0};
};

}  // namespace app
