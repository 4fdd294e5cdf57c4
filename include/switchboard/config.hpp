#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace switchboard {

struct Config {
    std::string sip_user;
    std::string sip_login;
    std::string sip_domain;
    std::string sip_password;
    std::optional<std::string> sip_caller_id;
    bool sip_null_device = true;
    int sip_port = 5060;
    int sip_max_calls = 64;
    bool sip_use_tcp = true;
    std::vector<std::string> sip_stun_servers;
    std::vector<std::string> sip_proxy_servers;
    std::string agent_uri_template = "sip:{agent}@{domain}";
    double events_delay = 0.010;
    double async_delay = 0.005;
    int pjsip_log_level = 1;
    std::optional<std::filesystem::path> hold_music_path;
    std::optional<std::string> hold_music_url;

    std::filesystem::path database_path = "switchboard.db";
    int rest_api_port = 8000;
    int dashboard_ws_port = 8001;
    std::optional<std::string> authorization_token;
    std::optional<std::string> directory_url;
    double directory_timeout = 10.0;

    std::string default_tenant = "default";
    // Dialed number -> owning tenant.
    std::map<std::string, std::string> tenant_numbers;

    int max_concurrent_calls = 3;
    std::map<std::string, int> tenant_max_concurrent_calls;
    int parking_slots = 10;
    int transfer_ring_timeout_ms = 30000;
    int ringing_timeout_ms = 30000;
    int reconnect_base_delay_ms = 1000;
    int reconnect_max_delay_ms = 30000;
    int reconnect_max_attempts = 10;
    int reconnect_hidden_threshold_ms = 30000;
    int heartbeat_interval_ms = 10000;
    int presence_stale_ms = 30000;
    int sweep_interval_ms = 1000;

    std::string log_level = "INFO";
    // "text" or "json" (one object per line).
    std::string log_format = "text";
    // Rotate the log file past this size; 0 keeps a single file.
    long long log_max_bytes = 0;
    int log_max_files = 5;
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;

    static Config load();
    void validate() const;

    int concurrency_bound_for(const std::string& tenant_id) const;
    std::string tenant_for_number(const std::string& dialed) const;
};

}
