#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "web/http.hpp"

namespace camrelay {

// Exact-path route table. Unknown paths answer 404, non-GET methods 405.
class Router {
public:
    bool add(const std::string& path, std::shared_ptr<RouteHandler> handler);
    RouteHandler* find(const std::string& path) const;
    std::vector<std::string> paths() const;

    void dispatch(const HttpRequest& request, ResponseWriter& writer) const;

private:
    std::map<std::string, std::shared_ptr<RouteHandler>> routes_;
};

}  // namespace camrelay
