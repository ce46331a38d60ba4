#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace camrelay {

using JpegBytes = std::vector<unsigned char>;

// Immutable once published; readers share it without copying.
using JpegBuffer = std::shared_ptr<const JpegBytes>;

struct EncodedFrame {
    JpegBuffer jpeg;
    uint64_t sequence{0};
    int64_t timestamp_ns{0};
};

enum class FrameWait {
    Frame,
    Timeout,
    Stopped,
};

}  // namespace camrelay
