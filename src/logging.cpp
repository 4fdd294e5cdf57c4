#include "switchboard/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include "switchboard/utils/time.hpp"

namespace switchboard::logging {

namespace {

constexpr const char* kLoggerName = "switchboard";
constexpr const char* kTextPattern = "%Y-%m-%d %H:%M:%S.%e %^%l%$ [%t] %v";

std::atomic<bool> g_json_lines{false};

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

spdlog::level::level_enum parse_level(const std::string& raw) {
    const auto value = upper(raw);
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" ,=\"[]") != std::string::npos;
}

spdlog::sink_ptr file_sink(const Config& config) {
    const std::filesystem::path log_path(*config.log_filename);
    if (!log_path.parent_path().empty()) {
        std::filesystem::create_directories(log_path.parent_path());
    }
    if (config.log_max_bytes > 0) {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path.string(), static_cast<std::size_t>(config.log_max_bytes),
            static_cast<std::size_t>(config.log_max_files));
    }
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true);
}

}

std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items) {
    if (items.size() == 0) {
        return message;
    }
    std::string result = message + " [";
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            result += ", ";
        }
        first = false;
        result += item.key;
        result += '=';
        if (!needs_quotes(item.value)) {
            result += item.value;
            continue;
        }
        result += '"';
        for (const char ch : item.value) {
            if (ch == '"' || ch == '\\') {
                result += '\\';
            }
            result += ch;
        }
        result += '"';
    }
    result += ']';
    return result;
}

std::string to_json_line(spdlog::level::level_enum level,
                         const std::string& message,
                         std::initializer_list<KeyValue> items) {
    nlohmann::json line;
    line["ts"] = utils::now_ms();
    const auto level_name = spdlog::level::to_string_view(level);
    line["level"] = std::string(level_name.data(), level_name.size());
    line["msg"] = message;
    for (const auto& item : items) {
        if (item.key == "ts" || item.key == "level" || item.key == "msg") {
            line["field_" + item.key] = item.value;
        } else {
            line[item.key] = item.value;
        }
    }
    // Remote display names from signaling are not guaranteed to be UTF-8.
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (config.log_filename) {
        sinks.push_back(file_sink(config));
    }

    if (spdlog::get(kLoggerName)) {
        spdlog::drop(kLoggerName);
    }
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    const bool json_lines = config.log_format == "json";
    logger->set_pattern(json_lines ? "%v" : kTextPattern);
    logger->set_level(parse_level(config.log_level));
    logger->flush_on(spdlog::level::warn);
    g_json_lines = json_lines;

    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    return spdlog::default_logger();
}

void flush() {
    if (auto logger = get_logger()) {
        logger->flush();
    }
}

void log(spdlog::level::level_enum level,
         const std::string& message,
         std::initializer_list<KeyValue> items) {
    auto logger = get_logger();
    if (!logger || !logger->should_log(level)) {
        return;
    }
    logger->log(level, g_json_lines ? to_json_line(level, message, items) : with_kv(message, items));
}

}
