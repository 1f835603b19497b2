#pragma once

#include <atomic>
#include <cstdint>

namespace domain {

// S3 Standard data transfer and request prices (USD).
inline constexpr double kUsdPerGiB = 0.09;
inline constexpr double kUsdPer1000Get = 0.0004;
inline constexpr double kUsdPer1000List = 0.005;

struct CostSnapshot {
    std::uint64_t listRequests{0};
    std::uint64_t getRequests{0};
    std::uint64_t bytesDownloaded{0};

    double estimatedCostUsd() const {
        const double dataCost = kUsdPerGiB * static_cast<double>(bytesDownloaded) / (1024.0 * 1024.0 * 1024.0);
        const double requestCost = kUsdPer1000Get * static_cast<double>(getRequests) / 1000.0 +
                                   kUsdPer1000List * static_cast<double>(listRequests) / 1000.0;
        return dataCost + requestCost;
    }

    CostSnapshot& operator+=(const CostSnapshot& other) {
        listRequests += other.listRequests;
        getRequests += other.getRequests;
        bytesDownloaded += other.bytesDownloaded;
        return *this;
    }
};

class CostCounters {
public:
    void recordList() { listRequests_.fetch_add(1, std::memory_order_relaxed); }

    void recordGet() { getRequests_.fetch_add(1, std::memory_order_relaxed); }
    void recordBytes(std::uint64_t bytes) { bytesDownloaded_.fetch_add(bytes, std::memory_order_relaxed); }

    CostSnapshot snapshot() const {
        CostSnapshot snap;
        snap.listRequests = listRequests_.load(std::memory_order_relaxed);
        snap.getRequests = getRequests_.load(std::memory_order_relaxed);
        snap.bytesDownloaded = bytesDownloaded_.load(std::memory_order_relaxed);
        return snap;
    }

private:
    std::atomic<std::uint64_t> listRequests_{0};
    std::atomic<std::uint64_t> getRequests_{0};
    std::atomic<std::uint64_t> bytesDownloaded_{0};
};

}  // namespace domain
