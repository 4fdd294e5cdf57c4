#pragma once

#include <chrono>
#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "switchboard/config.hpp"
#include "spdlog/logger.h"

namespace switchboard {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

template <typename T>
inline KeyValue kv(const std::string& key, const std::optional<T>& value) {
    if (!value) {
        return {key, "-"};
    }
    return kv(key, *value);
}

inline KeyValue kv(const std::string& key, bool value) {
    return {key, value ? "true" : "false"};
}

inline KeyValue kv(const std::string& key, std::chrono::milliseconds value) {
    return {key, std::to_string(value.count()) + "ms"};
}

// Text form: message [k=v, k="v w"]. Values with separators or spaces are quoted.
std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items);

// One JSON object per line: ts, level, msg and every key as a string field.
std::string to_json_line(spdlog::level::level_enum level,
                         const std::string& message,
                         std::initializer_list<KeyValue> items);

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();
void flush();

void log(spdlog::level::level_enum level,
         const std::string& message,
         std::initializer_list<KeyValue> items = {});

inline void trace(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message, std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;

}
