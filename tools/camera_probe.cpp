// Scans local camera indexes and reports which ones deliver frames, along with
// the resolution and frame rate each one actually runs at.

#include "camera/video_capture_source.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace {

constexpr int kTestFrames = 3;

struct ProbeResult {
    int index{0};
    std::string backend;
    int width{0};
    int height{0};
    double fps{0.0};
};

bool probeIndex(int index, ProbeResult& out) {
    for (const auto& backend : camrelay::VideoCaptureSource::backendCandidates("auto")) {
        cv::VideoCapture cap;
        try {
            if (!cap.open(index, backend.api)) {
                continue;
            }
            cv::Mat frame;
            bool good = false;
            for (int i = 0; i < kTestFrames; ++i) {
                if (cap.read(frame) && !frame.empty()) {
                    good = true;
                    break;
                }
            }
            if (!good) {
                std::cerr << "camera " << index << " opened with " << backend.name << " but produced no frames\n";
                cap.release();
                continue;
            }
            out.index = index;
            out.backend = backend.name;
            out.width = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
            out.height = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));
            out.fps = cap.get(cv::CAP_PROP_FPS);
            cap.release();
            return true;
        } catch (const cv::Exception& e) {
            std::cerr << "camera " << index << " backend " << backend.name << " threw: " << e.what() << '\n';
        }
    }
    return false;
}

}  // namespace

int main(int argc, char** argv) {
    const int max_index = (argc > 1) ? std::atoi(argv[1]) : 10;
    if (max_index < 0) {
        std::cerr << "usage: camrelay_probe [max_index]\n";
        return 2;
    }

    std::vector<ProbeResult> working;
    for (int idx = 0; idx <= max_index; ++idx) {
        ProbeResult r;
        if (probeIndex(idx, r)) {
            working.push_back(r);
        }
    }

    if (working.empty()) {
        std::cout << "No working cameras found in indexes 0.." << max_index << '\n';
        return 1;
    }

    std::cout << "Working cameras:\n";
    for (const auto& r : working) {
        std::cout << "  index " << r.index << " (" << r.backend << "): "
                  << r.width << "x" << r.height << " @ " << r.fps << " FPS\n";
    }
    std::cout << "Add a camera_<index> section per camera to config/camrelay.yaml to stream it.\n";
    return 0;
}
