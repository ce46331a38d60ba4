#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"
#include "web/http.hpp"

namespace camrelay {

// Builds the monitor page: one box per camera with its live stream and a row
// of direct stream links.
std::string renderIndexPage(const std::string& title, const std::vector<CameraConfig>& cameras);

class IndexPageHandler : public RouteHandler {
public:
    IndexPageHandler(const std::string& title, const std::vector<CameraConfig>& cameras);

    void handle(const HttpRequest& request, ResponseWriter& writer) override;
    const std::string& page() const { return page_; }

private:
    std::string page_;
};

}  // namespace camrelay
