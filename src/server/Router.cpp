#include "vaulttrade/server/Router.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace vaulttrade::server {
namespace {
std::string normalizeMethod(std::string method) {
    std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return method;
}

std::string escapeRegex(const std::string& token) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string percentDecode(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size() &&
            std::isxdigit(static_cast<unsigned char>(input[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(input[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(input.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(input[i]);
        }
    }
    return out;
}
}

void Router::addRoute(std::string method, std::string path, Handler handler) {
    RouteEntry entry;
    entry.method = normalizeMethod(std::move(method));
    entry.path = std::move(path);
    entry.handler = std::move(handler);

    std::string token;
    std::ostringstream regexBuilder;
    regexBuilder << '^';

    std::istringstream iss(entry.path);
    while (std::getline(iss, token, '/')) {
        if (token.empty()) {
            continue;
        }
        regexBuilder << '/';
        if (token.front() == ':') {
            entry.tokens.push_back(token.substr(1));
            regexBuilder << "([^/]+)";
        } else {
            regexBuilder << escapeRegex(token);
        }
    }

    regexBuilder << "/?$";
    entry.pattern = std::regex(regexBuilder.str());

    routes_.push_back(std::move(entry));
}

Router::Handler Router::resolve(const std::string& method,
                                const std::string& path,
                                std::unordered_map<std::string, std::string>& params) const {
    auto normalized = normalizeMethod(method);
    const std::string* pathToMatch = &path;
    std::string strippedPath;
    if (auto queryPos = path.find('?'); queryPos != std::string::npos) {
        strippedPath = path.substr(0, queryPos);
        if (strippedPath.empty()) {
            strippedPath = "/";
        }
        pathToMatch = &strippedPath;
    }
    for (const auto& entry : routes_) {
        if (!entry.method.empty() && !normalized.empty() && entry.method != normalized) {
            continue;
        }

        std::smatch match;
        if (std::regex_match(*pathToMatch, match, entry.pattern)) {
            params.clear();
            for (std::size_t i = 0; i < entry.tokens.size(); ++i) {
                if (i + 1 < match.size()) {
                    params.emplace(entry.tokens[i], percentDecode(match[i + 1].str()));
                }
            }
            return entry.handler;
        }
    }

    return nullptr;
}

} // namespace vaulttrade::server
