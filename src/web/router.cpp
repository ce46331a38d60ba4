#include "web/router.hpp"

#include <utility>

#include "core/logging.hpp"

namespace camrelay {

bool Router::add(const std::string& path, std::shared_ptr<RouteHandler> handler) {
    if (path.empty() || path[0] != '/' || !handler) {
        return false;
    }
    return routes_.emplace(path, std::move(handler)).second;
}

RouteHandler* Router::find(const std::string& path) const {
    const auto it = routes_.find(path);
    if (it == routes_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> Router::paths() const {
    std::vector<std::string> out;
    out.reserve(routes_.size());
    for (const auto& kv : routes_) {
        out.push_back(kv.first);
    }
    return out;
}

void Router::dispatch(const HttpRequest& request, ResponseWriter& writer) const {
    RouteHandler* handler = find(request.path);
    if (handler == nullptr) {
        logDebug("http", request.client_address + " " + request.method + " " + request.path + " -> 404");
        if (!writeString(writer, makeHttpErrorResponse(404, "No such resource: " + request.path))) {
            logDebug("http", "404 write to " + request.client_address + " failed");
        }
        return;
    }
    if (request.method != "GET") {
        if (!writeString(writer, makeHttpErrorResponse(405, "Only GET is supported"))) {
            logDebug("http", "405 write to " + request.client_address + " failed");
        }
        return;
    }
    handler->handle(request, writer);
}

}  // namespace camrelay
