#include "web/index_page.hpp"

#include "camera/camera_registry.hpp"
#include "core/logging.hpp"

namespace camrelay {

namespace {

std::string escapeHtml(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

const char* const kPageStyle = R"(    <style>
        body { font-family: Arial, sans-serif; margin: 0; padding: 20px; background-color: #f0f0f0; }
        .container { max-width: 1200px; margin: 0 auto; }
        h1 { text-align: center; color: #333; }
        .camera-grid { display: grid; grid-template-columns: repeat(auto-fit, minmax(400px, 1fr)); gap: 20px; margin-top: 20px; }
        .camera-box { background: white; border-radius: 8px; padding: 15px; box-shadow: 0 2px 10px rgba(0,0,0,0.1); }
        .camera-title { text-align: center; margin-bottom: 10px; font-weight: bold; color: #555; }
        .camera-stream { width: 100%; height: auto; border-radius: 4px; }
        .info { text-align: center; margin-top: 20px; color: #666; font-size: 14px; }
        @media (max-width: 768px) { .camera-grid { grid-template-columns: 1fr; } }
    </style>
)";

}  // namespace

std::string renderIndexPage(const std::string& title, const std::vector<CameraConfig>& cameras) {
    const std::string safe_title = escapeHtml(title);

    std::string boxes;
    std::string links;
    for (const auto& cam : cameras) {
        const std::string idx = std::to_string(cam.index);
        const std::string url = CameraRegistry::streamPath(cam.index);
        boxes += "            <div class=\"camera-box\">\n";
        boxes += "                <div class=\"camera-title\">Camera " + idx + " - " + escapeHtml(cam.description) + "</div>\n";
        boxes += "                <img src=\"" + url + "\" class=\"camera-stream\" alt=\"Camera " + idx + " Stream\">\n";
        boxes += "            </div>\n";
        if (!links.empty()) {
            links += " | ";
        }
        links += "<a href=\"" + url + "\">Camera " + idx + " Stream</a>";
    }

    std::string page;
    page += "<!DOCTYPE html>\n<html>\n<head>\n";
    page += "    <title>" + safe_title + "</title>\n";
    page += kPageStyle;
    page += "</head>\n<body>\n    <div class=\"container\">\n";
    page += "        <h1>" + safe_title + "</h1>\n";
    page += "        <div class=\"camera-grid\">\n" + boxes + "        </div>\n";
    page += "        <div class=\"info\">\n";
    page += "            <p>Refresh the page if streams don't load. Direct stream URLs:</p>\n";
    page += "            <p>" + links + "</p>\n";
    page += "        </div>\n    </div>\n</body>\n</html>\n";
    return page;
}

IndexPageHandler::IndexPageHandler(const std::string& title, const std::vector<CameraConfig>& cameras)
    : page_(renderIndexPage(title, cameras)) {}

void IndexPageHandler::handle(const HttpRequest& request, ResponseWriter& writer) {
    if (!writeString(writer, makeHttpResponse(200, "text/html; charset=utf-8", page_))) {
        logDebug("http", "index page write to " + request.client_address + " failed");
    }
}

}  // namespace camrelay
