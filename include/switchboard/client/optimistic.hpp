#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "switchboard/model/types.hpp"

namespace switchboard {

// Local entries shown before the store confirms them. Entries are keyed by a
// client-generated correlation id; provider ids are never used to match.
template <typename T>
class OptimisticLedger {
public:
    struct Pending {
        std::string correlation_id;
        T value;
        TimestampMs created_at = 0;
    };

    struct Confirmed {
        std::string correlation_id;
        T value;
    };

    using Entry = std::variant<Pending, Confirmed>;

    void add_pending(std::string correlation_id, T value, TimestampMs now) {
        const auto it = locate(correlation_id);
        Pending pending{correlation_id, std::move(value), now};
        if (it != entries_.end()) {
            *it = std::move(pending);
            return;
        }
        entries_.push_back(std::move(pending));
    }

    // Replaces the entry with the authoritative value. Unknown ids are ignored.
    bool confirm(const std::string& correlation_id, T value) {
        const auto it = locate(correlation_id);
        if (it == entries_.end()) {
            return false;
        }
        *it = Confirmed{correlation_id, std::move(value)};
        return true;
    }

    // Rolls back an entry whose store write failed.
    bool discard(const std::string& correlation_id) {
        const auto it = locate(correlation_id);
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    // Confirms every pending entry whose correlation id appears on a record.
    // KeyFn maps a record to std::optional<std::string>.
    template <typename Records, typename KeyFn>
    std::size_t reconcile(const Records& records, KeyFn key) {
        std::size_t confirmed = 0;
        for (const auto& record : records) {
            const std::optional<std::string> id = key(record);
            if (!id) {
                continue;
            }
            const auto it = locate(*id);
            if (it != entries_.end() && std::holds_alternative<Pending>(*it)) {
                *it = Confirmed{*id, record};
                ++confirmed;
            }
        }
        return confirmed;
    }

    // Drops pending entries created before the cutoff.
    std::size_t expire(TimestampMs cutoff) {
        const auto before = entries_.size();
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                      [cutoff](const Entry& entry) {
                                          const auto* pending = std::get_if<Pending>(&entry);
                                          return pending && pending->created_at < cutoff;
                                      }),
                       entries_.end());
        return before - entries_.size();
    }

    std::optional<Entry> find(const std::string& correlation_id) const {
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
            return id_of(entry) == correlation_id;
        });
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    bool is_pending(const std::string& correlation_id) const {
        const auto entry = find(correlation_id);
        return entry && std::holds_alternative<Pending>(*entry);
    }

    std::vector<T> values() const {
        std::vector<T> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            std::visit([&](const auto& item) { result.push_back(item.value); }, entry);
        }
        return result;
    }

    std::size_t pending_count() const {
        return static_cast<std::size_t>(
            std::count_if(entries_.begin(), entries_.end(), [](const Entry& entry) {
                return std::holds_alternative<Pending>(entry);
            }));
    }

    std::size_t size() const { return entries_.size(); }

private:
    static const std::string& id_of(const Entry& entry) {
        return std::visit([](const auto& item) -> const std::string& { return item.correlation_id; },
                          entry);
    }

    typename std::vector<Entry>::iterator locate(const std::string& correlation_id) {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
            return id_of(entry) == correlation_id;
        });
    }

    std::vector<Entry> entries_;
};

}
