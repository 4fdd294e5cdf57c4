#include "switchboard/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <httplib.h>
#include <iomanip>
#include <memory>
#include <sstream>

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

namespace switchboard::utils {

namespace {

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            result.push_back(' ');
        } else if (ch == '%' && i + 2 < value.size()) {
            const int high = hex_value(value[i + 1]);
            const int low = hex_value(value[i + 2]);
            if (high < 0 || low < 0) {
                result.push_back(ch);
                continue;
            }
            result.push_back(static_cast<char>(high * 16 + low));
            i += 2;
        } else {
            result.push_back(ch);
        }
    }
    return result;
}

}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed;
    std::string working = url;

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        parsed.scheme = working.substr(0, scheme_pos);
        std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        parsed.path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        parsed.host = working.substr(0, port_pos);
        const auto port_text = working.substr(port_pos + 1);
        if (port_text.empty() ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            throw InvalidValue("invalid port in url: " + url);
        }
        parsed.port = std::stoi(port_text);
    } else {
        parsed.host = working;
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    }
    if (parsed.host.empty()) {
        throw InvalidValue("url has no host: " + url);
    }
    return parsed;
}

namespace {

std::string build_url(const ParsedUrl& url) {
    std::ostringstream out;
    out << url.scheme << "://" << url.host;
    const bool default_port = (url.scheme == "https" && url.port == 443) ||
                              (url.scheme == "http" && url.port == 80);
    if (!default_port && url.port > 0) {
        out << ":" << url.port;
    }
    if (!url.path.empty() && url.path.front() != '/') {
        out << '/';
    }
    out << url.path;
    return out.str();
}

}

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    if (location.empty()) {
        return "";
    }
    auto base = parse_url(base_url);
    if (location.front() == '/') {
        base.path = location;
        return build_url(base);
    }
    const auto slash = base.path.find_last_of('/');
    const std::string base_dir = (slash == std::string::npos)
                                     ? "/"
                                     : base.path.substr(0, slash + 1);
    base.path = base_dir + location;
    return build_url(base);
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> result;
    std::string working = query;
    if (!working.empty() && working.front() == '?') {
        working.erase(working.begin());
    }
    std::stringstream stream(working);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            result[url_decode(pair)] = "";
        } else {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
    }
    return result;
}

bool download_file(const std::string& url, const std::filesystem::path& path) {
    std::string current_url = url;
    for (int attempt = 0; attempt < 5; ++attempt) {
        ParsedUrl target;
        try {
            target = parse_url(current_url);
        } catch (const InvalidValue& ex) {
            logging::error("Download url rejected", {kv("url", current_url), kv("error", ex.what())});
            return false;
        }

        std::unique_ptr<httplib::Client> http_client;
        std::unique_ptr<httplib::SSLClient> https_client;
        if (target.scheme == "https") {
            https_client = std::make_unique<httplib::SSLClient>(target.host, target.port);
            https_client->set_url_encode(false);
        } else {
            http_client = std::make_unique<httplib::Client>(target.host, target.port);
            http_client->set_url_encode(false);
        }

        const httplib::Headers request_headers = {
            {"User-Agent", "switchboard/1.0"},
            {"Accept", "*/*"}
        };
        auto response = https_client ? https_client->Get(target.path.c_str(), request_headers)
                                     : http_client->Get(target.path.c_str(), request_headers);
        if (!response) {
            logging::error("Download request failed", {kv("url", current_url)});
            return false;
        }
        if (response->status >= 200 && response->status < 300) {
            std::error_code ec;
            if (!path.parent_path().empty()) {
                std::filesystem::create_directories(path.parent_path(), ec);
            }
            std::ofstream out(path, std::ios::binary);
            out.write(response->body.data(),
                      static_cast<std::streamsize>(response->body.size()));
            out.close();
            return static_cast<bool>(out);
        }
        if (response->status == 301 || response->status == 302 ||
            response->status == 303 || response->status == 307 ||
            response->status == 308) {
            auto location_it = response->headers.find("Location");
            if (location_it == response->headers.end()) {
                logging::error("Download redirect missing location",
                               {kv("status", response->status), kv("url", current_url)});
                return false;
            }
            const auto next_url = resolve_redirect_url(current_url, location_it->second);
            if (next_url.empty()) {
                logging::error("Download redirect invalid",
                               {kv("location", location_it->second), kv("url", current_url)});
                return false;
            }
            logging::debug("Download redirect",
                           {kv("status", response->status), kv("to", next_url)});
            current_url = next_url;
            continue;
        }
        logging::error("Download failed",
                       {kv("status", response->status), kv("url", current_url)});
        return false;
    }
    logging::error("Download failed: too many redirects", {kv("url", current_url)});
    return false;
}

}
