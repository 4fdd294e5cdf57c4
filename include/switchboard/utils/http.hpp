#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace switchboard::utils {

struct ParsedUrl {
    std::string scheme = "http";
    std::string host;
    int port = 0;
    std::string path = "/";
};

// Throws InvalidValue when the url has no host or a malformed port.
ParsedUrl parse_url(const std::string& url);

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location);

std::string url_encode(const std::string& value);

// Parses "a=1&b=x%20y" into a map; later duplicates win.
std::map<std::string, std::string> parse_query(const std::string& query);

// Fetches hold music and similar assets. Follows up to five redirects.
bool download_file(const std::string& url, const std::filesystem::path& path);

}
