#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <utility>

#include "adapters/s3/S3ObjectStore.hpp"
#include "app/HarvestWorker.hpp"
#include "archive/ArchiveClient.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

constexpr int kExitCostLimit = 2;

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        auto config = harvest::common::Config::fromArgs(argc, argv);
        harvest::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << harvest::log::levelToString(config.logLevel));
        LOG_INFO("  Legacy endpoint: " << config.legacyHost);
        LOG_INFO("  Partitioned endpoint: " << config.partitionedHost);
        LOG_INFO("  Timeout: " << config.timeoutSec << " s, TLS verification: "
                               << (config.verifyTls ? "on" : "off")
                               << (config.caFile.empty() ? "" : ", CA file: ") << config.caFile);

        archive::LegacyArchiveBackend::Layout legacyLayout;
        archive::PartitionedBackend::Layout partitionedLayout;

        adapters::s3::S3ObjectStore::Config storeConfig;
        storeConfig.endpoints[legacyLayout.bucket] = config.legacyHost;
        storeConfig.endpoints[partitionedLayout.bucket] = config.partitionedHost;
        storeConfig.request.timeoutSec = static_cast<int>(config.timeoutSec);
        storeConfig.request.tls.verifyPeer = config.verifyTls;
        storeConfig.request.tls.caFile = config.caFile;

        auto store = std::make_shared<adapters::s3::S3ObjectStore>(std::move(storeConfig));
        archive::ArchiveClient client(store, std::move(legacyLayout), std::move(partitionedLayout));

        app::HarvestWorker worker(client, app::HarvestWorker::Options::fromConfig(config));
        const auto summary = worker.run();

        if (summary.costLimitHit) {
            return kExitCostLimit;
        }
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
