#include "core/telemetry.hpp"

#include <iostream>
#include <thread>
#include <vector>

int main() {
    camrelay::ConnectionCounter counter;
    if (counter.increment() != 1 || counter.increment() != 2 || counter.decrement() != 1) {
        std::cerr << "increment/decrement should return the new count\n";
        return 1;
    }
    counter.decrement();

    constexpr int kThreads = 8;
    constexpr int kRounds = 10000;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&counter]() {
            for (int i = 0; i < kRounds; ++i) {
                counter.increment();
                counter.decrement();
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    if (counter.active() != 0) {
        std::cerr << "concurrent connect/disconnect should balance to 0, got " << counter.active() << "\n";
        return 1;
    }

    camrelay::Telemetry telemetry;
    telemetry.addCaptured();
    telemetry.addCaptured();
    telemetry.addPublished();
    telemetry.addRateDropped();
    const camrelay::TelemetrySnapshot s = telemetry.snapshot();
    if (s.frames_captured != 2 || s.frames_published != 1 || s.frames_rate_dropped != 1 || s.read_failures != 0) {
        std::cerr << "telemetry snapshot mismatch\n";
        return 1;
    }
    return 0;
}
