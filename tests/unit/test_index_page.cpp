#include "web/index_page.hpp"

#include <iostream>

#include "camera/camera_registry.hpp"
#include "support/capture_writer.hpp"

int main() {
    auto cameras = camrelay::CameraRegistry::builtinCameras();
    cameras[1].description = "Beds <north> & \"south\"";

    const std::string page = camrelay::renderIndexPage("Tank & Beds", cameras);
    if (page.find("<title>Tank &amp; Beds</title>") == std::string::npos) {
        std::cerr << "title should be HTML-escaped\n";
        return 1;
    }
    if (page.find("Camera 0 - Main Camera (Fish Tank)") == std::string::npos) {
        std::cerr << "camera 0 box missing\n";
        return 1;
    }
    if (page.find("Beds &lt;north&gt; &amp; &quot;south&quot;") == std::string::npos) {
        std::cerr << "camera descriptions should be HTML-escaped\n";
        return 1;
    }
    if (camrelay::testing::countOccurrences(page, "class=\"camera-box\"") != 2) {
        std::cerr << "expected one box per camera\n";
        return 1;
    }
    if (page.find("<a href=\"/stream0.mjpg\">Camera 0 Stream</a> | <a href=\"/stream2.mjpg\">Camera 2 Stream</a>") ==
        std::string::npos) {
        std::cerr << "direct stream links missing\n";
        return 1;
    }

    camrelay::IndexPageHandler handler("Tank & Beds", cameras);
    camrelay::testing::CaptureWriter w;
    camrelay::HttpRequest req;
    req.method = "GET";
    req.path = "/";
    handler.handle(req, w);
    const std::string out = w.data();
    if (out.find("Content-Length: " + std::to_string(page.size()) + "\r\n") == std::string::npos ||
        out.compare(out.size() - page.size(), page.size(), page) != 0) {
        std::cerr << "handler should serve the rendered page with its length\n";
        return 1;
    }
    return 0;
}
