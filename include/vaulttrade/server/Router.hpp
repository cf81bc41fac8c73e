#pragma once

#include "vaulttrade/server/RequestContext.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vaulttrade::server {

class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    // `path` segments starting with ':' capture into pathParameters.
    void addRoute(std::string method, std::string path, Handler handler);

    // Empty handler when nothing matches.
    Handler resolve(const std::string& method,
                    const std::string& path,
                    std::unordered_map<std::string, std::string>& params) const;

private:
    struct RouteEntry {
        std::string method;
        std::string path;
        std::regex pattern;
        std::vector<std::string> tokens;
        Handler handler;
    };

    std::vector<RouteEntry> routes_;
};

} // namespace vaulttrade::server
