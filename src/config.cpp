#include "switchboard/config.hpp"

#include "switchboard/utils/address.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace switchboard {

namespace {

std::optional<std::string> raw_env(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string get_env_str(const char* name, const std::string& fallback) {
    return raw_env(name).value_or(fallback);
}

std::optional<std::string> get_env_optional(const char* name) {
    auto value = raw_env(name);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return value;
}

bool get_env_bool(const char* name, bool fallback) {
    auto value = raw_env(name);
    if (!value) {
        return fallback;
    }
    std::transform(value->begin(), value->end(), value->begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (*value == "true" || *value == "1" || *value == "yes") {
        return true;
    }
    if (*value == "false" || *value == "0" || *value == "no" || value->empty()) {
        return false;
    }
    throw std::runtime_error(std::string(name) + " must be true or false, got: " + *value);
}

// Parses a numeric variable; a malformed value names the variable in the error.
template <typename T, typename Parse>
T parse_env_number(const char* name, T fallback, Parse parse) {
    const auto value = raw_env(name);
    if (!value) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const T parsed = parse(*value, &consumed);
        if (consumed != value->size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error(std::string(name) + " must be a number, got: " + *value);
    }
}

int get_env_int(const char* name, int fallback) {
    return parse_env_number<int>(name, fallback, [](const std::string& raw, std::size_t* pos) {
        return std::stoi(raw, pos);
    });
}

long long get_env_int64(const char* name, long long fallback) {
    return parse_env_number<long long>(
        name, fallback, [](const std::string& raw, std::size_t* pos) { return std::stoll(raw, pos); });
}

double get_env_double(const char* name, double fallback) {
    return parse_env_number<double>(name, fallback, [](const std::string& raw, std::size_t* pos) {
        return std::stod(raw, pos);
    });
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::map<std::string, int> parse_tenant_bounds(const std::string& raw) {
    if (raw.empty()) {
        return {};
    }
    auto json = nlohmann::json::parse(raw);
    if (!json.is_object()) {
        throw std::runtime_error("TENANT_MAX_CONCURRENT_CALLS must be a JSON object");
    }
    std::map<std::string, int> result;
    for (auto it = json.begin(); it != json.end(); ++it) {
        result[it.key()] = it.value().get<int>();
    }
    return result;
}

std::map<std::string, std::string> parse_tenant_numbers(const std::string& raw) {
    if (raw.empty()) {
        return {};
    }
    auto json = nlohmann::json::parse(raw);
    if (!json.is_object()) {
        throw std::runtime_error("TENANT_NUMBERS must be a JSON object");
    }
    std::map<std::string, std::string> result;
    for (auto it = json.begin(); it != json.end(); ++it) {
        result[utils::normalize_address(it.key())] = it.value().get<std::string>();
    }
    return result;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

// Variables already set in the process environment take precedence over the file.
void set_env_default(const std::string& key, const std::string& value) {
    if (std::getenv(key.c_str())) {
        return;
    }
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 0);
#endif
}

// Quoted values are taken verbatim; unquoted ones lose a trailing " # comment".
std::string dotenv_value(const std::string& raw) {
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'') &&
        raw.back() == raw.front()) {
        return raw.substr(1, raw.size() - 2);
    }
    const auto comment = raw.find(" #");
    return trim(comment == std::string::npos ? raw : raw.substr(0, comment));
}

void load_dotenv(const std::filesystem::path& dotenv_path) {
    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }
    std::string line;
    int line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const auto eq_pos = line.find('=');
        const auto key = eq_pos == std::string::npos ? std::string() : trim(line.substr(0, eq_pos));
        if (key.empty()) {
            throw std::runtime_error(dotenv_path.string() + ":" + std::to_string(line_number) +
                                     ": expected KEY=value");
        }
        set_env_default(key, dotenv_value(trim(line.substr(eq_pos + 1))));
    }
}

}

Config Config::load() {
    load_dotenv(get_env_str("DOTENV_PATH", (std::filesystem::current_path() / ".env").string()));
    Config config;

    config.sip_user = get_env_str("SIP_USER", "switchboard");
    config.sip_login = get_env_str("SIP_LOGIN", config.sip_user);
    config.sip_domain = get_env_str("SIP_DOMAIN", "sip.linphone.org");
    config.sip_password = get_env_str("SIP_PASSWORD", "password");
    config.sip_caller_id = get_env_optional("SIP_CALLER_ID");
    config.sip_null_device = get_env_bool("SIP_NULL_DEVICE", true);
    config.sip_port = get_env_int("SIP_PORT", 5060);
    config.sip_max_calls = get_env_int("SIP_MAX_CALLS", 64);
    config.sip_use_tcp = get_env_bool("SIP_USE_TCP", true);
    config.sip_stun_servers = split_csv(get_env_str("SIP_STUN_SERVERS", ""));
    config.sip_proxy_servers = split_csv(get_env_str("SIP_PROXY_SERVERS", ""));
    config.agent_uri_template = get_env_str("AGENT_URI_TEMPLATE", "sip:{agent}@{domain}");
    config.events_delay = get_env_double("EVENTS_DELAY", 0.010);
    config.async_delay = get_env_double("ASYNC_DELAY", 0.005);
    config.pjsip_log_level = get_env_int("PJSIP_LOG_LEVEL", 1);
    if (const auto hold_music = get_env_optional("HOLD_MUSIC_PATH")) {
        config.hold_music_path = std::filesystem::path(*hold_music);
    }
    config.hold_music_url = get_env_optional("HOLD_MUSIC_URL");

    config.database_path = get_env_str("DATABASE_PATH", "switchboard.db");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.dashboard_ws_port = get_env_int("DASHBOARD_WS_PORT", 8001);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.directory_url = get_env_optional("DIRECTORY_URL");
    config.directory_timeout = get_env_double("DIRECTORY_TIMEOUT", 10.0);

    config.default_tenant = get_env_str("DEFAULT_TENANT", "default");
    config.tenant_numbers = parse_tenant_numbers(get_env_str("TENANT_NUMBERS", ""));
    config.max_concurrent_calls = get_env_int("MAX_CONCURRENT_CALLS", 3);
    config.tenant_max_concurrent_calls =
        parse_tenant_bounds(get_env_str("TENANT_MAX_CONCURRENT_CALLS", ""));
    config.parking_slots = get_env_int("PARKING_SLOTS", 10);
    config.transfer_ring_timeout_ms = get_env_int("TRANSFER_RING_TIMEOUT_MS", 30000);
    config.ringing_timeout_ms = get_env_int("RINGING_TIMEOUT_MS", 30000);
    config.reconnect_base_delay_ms = get_env_int("RECONNECT_BASE_DELAY_MS", 1000);
    config.reconnect_max_delay_ms = get_env_int("RECONNECT_MAX_DELAY_MS", 30000);
    config.reconnect_max_attempts = get_env_int("RECONNECT_MAX_ATTEMPTS", 10);
    config.reconnect_hidden_threshold_ms = get_env_int("RECONNECT_HIDDEN_THRESHOLD_MS", 30000);
    config.heartbeat_interval_ms = get_env_int("HEARTBEAT_INTERVAL_MS", 10000);
    config.presence_stale_ms = get_env_int("PRESENCE_STALE_MS", 30000);
    config.sweep_interval_ms = get_env_int("SWEEP_INTERVAL_MS", 1000);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    config.log_format = get_env_str("LOG_FORMAT", "text");
    config.log_max_bytes = get_env_int64("LOG_MAX_BYTES", 0);
    config.log_max_files = get_env_int("LOG_MAX_FILES", 5);
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    return config;
}

void Config::validate() const {
    if (sip_user.empty()) {
        throw std::runtime_error("SIP_USER is required");
    }
    if (sip_domain.empty()) {
        throw std::runtime_error("SIP_DOMAIN is required");
    }
    if (sip_port <= 0) {
        throw std::runtime_error("SIP_PORT must be positive");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (dashboard_ws_port <= 0 || dashboard_ws_port == rest_api_port) {
        throw std::runtime_error("DASHBOARD_WS_PORT must be positive and differ from REST_API_PORT");
    }
    if (default_tenant.empty()) {
        throw std::runtime_error("DEFAULT_TENANT must not be empty");
    }
    if (max_concurrent_calls <= 0) {
        throw std::runtime_error("MAX_CONCURRENT_CALLS must be positive");
    }
    for (const auto& item : tenant_max_concurrent_calls) {
        if (item.second <= 0) {
            throw std::runtime_error("TENANT_MAX_CONCURRENT_CALLS values must be positive");
        }
    }
    if (parking_slots <= 0) {
        throw std::runtime_error("PARKING_SLOTS must be positive");
    }
    if (transfer_ring_timeout_ms <= 0 || ringing_timeout_ms <= 0) {
        throw std::runtime_error("ring timeouts must be positive");
    }
    if (reconnect_base_delay_ms <= 0 || reconnect_max_delay_ms < reconnect_base_delay_ms) {
        throw std::runtime_error("RECONNECT_MAX_DELAY_MS must be >= RECONNECT_BASE_DELAY_MS > 0");
    }
    if (reconnect_max_attempts <= 0) {
        throw std::runtime_error("RECONNECT_MAX_ATTEMPTS must be positive");
    }
    if (heartbeat_interval_ms <= 0 || sweep_interval_ms <= 0) {
        throw std::runtime_error("loop intervals must be positive");
    }
    if (log_format != "text" && log_format != "json") {
        throw std::runtime_error("LOG_FORMAT must be text or json");
    }
    if (log_max_bytes < 0 || log_max_files <= 0) {
        throw std::runtime_error("LOG_MAX_BYTES must be >= 0 and LOG_MAX_FILES positive");
    }
}

int Config::concurrency_bound_for(const std::string& tenant_id) const {
    const auto it = tenant_max_concurrent_calls.find(tenant_id);
    if (it != tenant_max_concurrent_calls.end()) {
        return it->second;
    }
    return max_concurrent_calls;
}

std::string Config::tenant_for_number(const std::string& dialed) const {
    const auto it = tenant_numbers.find(utils::normalize_address(dialed));
    if (it != tenant_numbers.end()) {
        return it->second;
    }
    return default_tenant;
}

}
