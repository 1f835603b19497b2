#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

#include "app/BoundedWorkerPool.hpp"

int main() {
    using namespace std::chrono_literals;

    {
        std::atomic<int> done{0};
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        {
            app::BoundedWorkerPool pool(3, 2);
            for (int i = 0; i < 20; ++i) {
                const bool accepted = pool.submit([&]() {
                    const int now = running.fetch_add(1) + 1;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                    }
                    std::this_thread::sleep_for(2ms);
                    running.fetch_sub(1);
                    done.fetch_add(1);
                });
                if (!accepted) {
                    std::cerr << "Running pool should accept work\n";
                    return 1;
                }
            }
            pool.shutdown();
        }
        if (done.load() != 20) {
            std::cerr << "Every queued task should run before shutdown returns, ran " << done.load() << "\n";
            return 1;
        }
        if (peak.load() > 3) {
            std::cerr << "At most 3 tasks should run at once, saw " << peak.load() << "\n";
            return 1;
        }
    }

    {
        // submit() blocks while the queue is full.
        std::atomic<bool> release{false};
        std::atomic<int> submitted{0};
        app::BoundedWorkerPool pool(1, 1);
        pool.submit([&]() {
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
        });
        std::thread producer([&]() {
            for (int i = 0; i < 3; ++i) {
                pool.submit([]() {});
                submitted.fetch_add(1);
            }
        });
        std::this_thread::sleep_for(50ms);
        const int whileBlocked = submitted.load();
        release.store(true);
        producer.join();
        if (whileBlocked > 1) {
            std::cerr << "Producer ran ahead of a full queue (" << whileBlocked << " submitted)\n";
            return 1;
        }
        if (submitted.load() != 3) {
            std::cerr << "Producer should finish once the worker drains the queue\n";
            return 1;
        }
    }

    {
        app::BoundedWorkerPool pool(1, 1);
        pool.shutdown();
        if (pool.submit([]() {})) {
            std::cerr << "Shut down pool should refuse work\n";
            return 1;
        }
    }

    std::cout << "test_worker_pool passed\n";
    return 0;
}
