#include "core/telemetry.hpp"

namespace camrelay {

TelemetrySnapshot Telemetry::snapshot() const {
    return TelemetrySnapshot{
        frames_captured_.load(),
        frames_published_.load(),
        frames_rate_dropped_.load(),
        read_failures_.load(),
        encode_failures_.load(),
        process_failures_.load()};
}

}  // namespace camrelay
