#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cmdb_fetch {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path prefix without a trailing slash, may be empty
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Split @p text on @p sep and trim surrounding whitespace from each piece.
/// Empty pieces are kept, so "" yields one empty string.
std::vector<std::string> splitAndTrim(const std::string& text, char sep = ',');

std::string joinStrings(const std::vector<std::string>& parts, char sep = ',');

/// Parse a strictly positive integer option value such as "--pool-size 8".
/// Throws std::invalid_argument naming @p option if @p value is not a whole
/// number in [1, INT_MAX].
int parsePositiveInt(const std::string& option, const std::string& value);

/// Compact JSON for log lines; invalid UTF-8 is replaced instead of throwing.
std::string dumpForLog(const nlohmann::json& value);

} // namespace cmdb_fetch
