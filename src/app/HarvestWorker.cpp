#include "app/HarvestWorker.hpp"

#include <exception>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include "app/BoundedWorkerPool.hpp"
#include "app/MeasurementTrimmer.hpp"
#include "archive/ArchiveClient.hpp"
#include "archive/BackendSupport.hpp"
#include "codec/GzipWriter.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace app {
namespace {

constexpr const char* kOutputSuffix = ".jsonl.gz";

std::string mebibytes(std::uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << static_cast<double>(bytes) / (1024.0 * 1024.0);
    return out.str();
}

std::string usd(double amount) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6) << amount;
    return out.str();
}

}  // namespace

HarvestWorker::Options HarvestWorker::Options::fromConfig(const harvest::common::Config& config) {
    Options options;
    options.country = config.country;
    options.firstDate = config.firstDate;
    options.lastDate = config.lastDate;
    options.testType = config.testType;
    options.maxStringSize = config.maxStringSize;
    options.costLimitUsd = config.costLimitUsd;
    options.outputDir = config.outputDir;
    options.concurrency = config.concurrency;
    options.limit = config.limit;
    return options;
}

HarvestWorker::HarvestWorker(archive::ArchiveClient& client, Options options)
    : client_(client), options_(std::move(options)) {}

std::string HarvestWorker::outputName(const std::string& key) {
    std::string basename(archive::lastComponent(key));
    if (archive::endsWith(basename, kOutputSuffix)) {
        return basename;
    }
    // Drop up to two extensions: ".tar.lz4", ".json.lz4".
    for (int i = 0; i < 2; ++i) {
        const auto dot = basename.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            break;
        }
        basename.erase(dot);
    }
    return basename + kOutputSuffix;
}

std::string HarvestWorker::outputPath(const archive::FileEntry& entry) const {
    const auto path = std::filesystem::path(options_.outputDir) / entry.country() / entry.date().toIso() /
                      outputName(entry.location().key);
    return path.string();
}

bool HarvestWorker::costLimitReached_() const {
    return client_.estimatedCostUsd() > options_.costLimitUsd;
}

HarvestWorker::Summary HarvestWorker::run() {
    LOG_INFO("Harvesting " << options_.testType << " measurements for " << options_.country << " from "
                           << options_.firstDate << " to " << options_.lastDate << " into " << options_.outputDir);
    LOG_INFO("  cost limit: $" << usd(options_.costLimitUsd) << ", concurrency: " << options_.concurrency
                               << ", limit: " << options_.limit);

    std::size_t scheduled = 0;
    {
        BoundedWorkerPool pool(options_.concurrency, options_.concurrency);
        auto entries = client_.listFiles(options_.firstDate, options_.lastDate, options_.testType, options_.country);
        while (!stop_.load()) {
            if (options_.limit != 0 && scheduled >= options_.limit) {
                LOG_INFO("Reached --limit " << options_.limit << ", not scheduling more entries");
                break;
            }
            if (costLimitReached_()) {
                costLimitHit_.store(true);
                break;
            }
            std::optional<archive::FileEntry> entry;
            try {
                entry = entries->next();
            } catch (const domain::ArchiveError& ex) {
                LOG_ERR("Listing failed: " << ex.what());
                ++entriesFailed_;
                break;
            }
            if (!entry) {
                break;
            }
            auto shared = std::make_shared<archive::FileEntry>(std::move(*entry));
            if (!pool.submit([this, shared]() { harvestEntry_(*shared); })) {
                break;
            }
            ++scheduled;
        }
        pool.shutdown();
    }

    Summary summary;
    summary.entriesOk = entriesOk_.load();
    summary.entriesFailed = entriesFailed_.load();
    summary.entriesSkipped = entriesSkipped_.load();
    summary.recordsWritten = recordsWritten_.load();
    summary.recordsLost = recordsLost_.load();
    summary.membersTrimmed = membersTrimmed_.load();
    summary.costLimitHit = costLimitHit_.load();
    summary.costs = client_.costs();

    if (summary.costLimitHit) {
        LOG_WARN("Cost limit $" << usd(options_.costLimitUsd) << " reached after downloading "
                                << mebibytes(summary.costs.bytesDownloaded) << " MiB");
    }
    LOG_INFO("Download size: " << mebibytes(summary.costs.bytesDownloaded) << " MiB, LIST requests: "
                               << summary.costs.listRequests << ", GET requests: " << summary.costs.getRequests
                               << ", Estimated Cost: $" << usd(summary.costs.estimatedCostUsd()));
    LOG_INFO("Entries ok=" << summary.entriesOk << " failed=" << summary.entriesFailed
                           << " skipped=" << summary.entriesSkipped << ", records written="
                           << summary.recordsWritten << " lost=" << summary.recordsLost
                           << ", trimmed members=" << summary.membersTrimmed);
    return summary;
}

void HarvestWorker::harvestEntry_(const archive::FileEntry& entry) {
    if (stop_.load()) {
        ++entriesSkipped_;
        return;
    }
    if (costLimitReached_()) {
        costLimitHit_.store(true);
        stop_.store(true);
        ++entriesSkipped_;
        LOG_WARN("Cost limit reached, skipping " << entry.describe());
        return;
    }

    const std::filesystem::path target{outputPath(entry)};
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        LOG_ERR("Cannot create " << target.parent_path().string() << " for " << entry.describe() << ": "
                                 << ec.message());
        ++entriesFailed_;
        return;
    }

    std::uint64_t written = 0;
    std::uint64_t lost = 0;
    std::size_t partialFailures = 0;
    try {
        codec::GzipWriter output(target.string());
        auto measurements = entry.getMeasurements();
        // Failures of one segment or line leave the rest of the entry readable.
        while (true) {
            std::optional<boost::json::value> measurement;
            try {
                measurement = measurements->next();
            } catch (const domain::DecodeError& ex) {
                lost += ex.lostRecords();
                ++partialFailures;
                LOG_WARN("Partial decode failure in " << entry.describe() << ": " << ex.what());
                continue;
            } catch (const domain::FetchError& ex) {
                lost += ex.lostRecords();
                ++partialFailures;
                LOG_WARN("Partial fetch failure in " << entry.describe() << ": " << ex.what());
                continue;
            }
            if (!measurement) {
                break;
            }
            membersTrimmed_ += trimMeasurement(*measurement, options_.maxStringSize);
            output.writeLine(boost::json::serialize(*measurement));
            ++written;
        }
        output.close();
        if (written == 0 && partialFailures > 0) {
            throw domain::DecodeError("no readable measurement", lost);
        }
    } catch (const std::exception& ex) {
        LOG_ERR("Failed " << entry.describe() << ": " << ex.what());
        std::filesystem::remove(target, ec);
        recordsLost_ += lost;
        ++entriesFailed_;
        return;
    }

    recordsWritten_ += written;
    recordsLost_ += lost;
    ++entriesOk_;
    LOG_INFO("Downloaded " << entry.location().url() << " [" << entry.sizeBytes() << " bytes, " << written
                           << " records]");
}

}  // namespace app
