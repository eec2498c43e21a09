#include "util.hpp"

#include <climits>
#include <stdexcept>

namespace cmdb_fetch {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parts.scheme);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority = url.substr(hostStart);
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // API paths are appended to the target, so it never ends with '/'.
    while (!parts.target.empty() && parts.target.back() == '/') {
        parts.target.pop_back();
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty()) {
            throw std::invalid_argument("Invalid URL (empty port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::vector<std::string> splitAndTrim(const std::string& text, char sep) {
    std::vector<std::string> pieces;
    std::string::size_type begin = 0;

    while (true) {
        auto end = text.find(sep, begin);
        std::string piece = text.substr(begin, end == std::string::npos
                                                   ? std::string::npos
                                                   : end - begin);

        auto first = piece.find_first_not_of(" \t\r\n");
        auto last  = piece.find_last_not_of(" \t\r\n");
        pieces.push_back(first == std::string::npos
                             ? std::string()
                             : piece.substr(first, last - first + 1));

        if (end == std::string::npos) break;
        begin = end + 1;
    }
    return pieces;
}

std::string joinStrings(const std::vector<std::string>& parts, char sep) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += sep;
        joined += parts[i];
    }
    return joined;
}

int parsePositiveInt(const std::string& option, const std::string& value) {
    long long parsed = 0;
    std::size_t used = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a positive integer, got '" +
                                    value + "'");
    }
    if (used != value.size() || parsed <= 0 || parsed > INT_MAX) {
        throw std::invalid_argument(option + " expects a positive integer, got '" +
                                    value + "'");
    }
    return static_cast<int>(parsed);
}

std::string dumpForLog(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cmdb_fetch
