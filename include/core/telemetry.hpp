#pragma once

#include <atomic>
#include <cstdint>

namespace camrelay {

struct TelemetrySnapshot {
    uint64_t frames_captured{0};
    uint64_t frames_published{0};
    uint64_t frames_rate_dropped{0};
    uint64_t read_failures{0};
    uint64_t encode_failures{0};
    uint64_t process_failures{0};
};

// Producer-side counters for one camera pipeline.
class Telemetry {
public:
    void addCaptured() { frames_captured_.fetch_add(1); }
    void addPublished() { frames_published_.fetch_add(1); }
    void addRateDropped() { frames_rate_dropped_.fetch_add(1); }
    void addReadFailure() { read_failures_.fetch_add(1); }
    void addEncodeFailure() { encode_failures_.fetch_add(1); }
    void addProcessFailure() { process_failures_.fetch_add(1); }

    TelemetrySnapshot snapshot() const;

private:
    std::atomic<uint64_t> frames_captured_{0};
    std::atomic<uint64_t> frames_published_{0};
    std::atomic<uint64_t> frames_rate_dropped_{0};
    std::atomic<uint64_t> read_failures_{0};
    std::atomic<uint64_t> encode_failures_{0};
    std::atomic<uint64_t> process_failures_{0};
};

// Number of currently open connections of one endpoint kind.
class ConnectionCounter {
public:
    int increment() { return active_.fetch_add(1) + 1; }
    int decrement() { return active_.fetch_sub(1) - 1; }
    int active() const { return active_.load(); }

private:
    std::atomic<int> active_{0};
};

}  // namespace camrelay
