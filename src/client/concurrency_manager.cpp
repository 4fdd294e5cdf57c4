#include "switchboard/client/concurrency_manager.hpp"

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace switchboard {

const char* to_string(HandleStatus status) {
    switch (status) {
        case HandleStatus::Pending:
            return "pending";
        case HandleStatus::Connecting:
            return "connecting";
        case HandleStatus::Open:
            return "open";
        case HandleStatus::Closed:
            return "closed";
    }
    return "closed";
}

ConcurrencyManager::ConcurrencyManager(std::shared_ptr<TelephonyProvider> device,
                                       int max_sessions,
                                       std::shared_ptr<SessionSync> sync,
                                       utils::Clock clock)
    : device_(std::move(device)),
      max_sessions_(max_sessions),
      sync_(std::move(sync)),
      clock_(std::move(clock)) {
    if (!device_) {
        throw InvalidValue("concurrency manager needs a device");
    }
    if (max_sessions_ <= 0) {
        throw InvalidValue("concurrency bound must be positive");
    }
}

template <typename Fn>
void ConcurrencyManager::sync(const char* what, const ClientSessionHandle& handle, Fn fn) {
    if (!sync_) {
        return;
    }
    try {
        fn(*sync_, handle);
    } catch (const std::exception& ex) {
        logging::warn("Session sync failed",
                      {kv("op", what), kv("leg", handle.leg_id), kv("error", ex.what())});
    }
}

ClientSessionHandle* ConcurrencyManager::find_locked(const std::string& leg_id) {
    auto it = std::find_if(handles_.begin(), handles_.end(),
                           [&](const ClientSessionHandle& handle) { return handle.leg_id == leg_id; });
    return it == handles_.end() ? nullptr : &*it;
}

ClientSessionHandle* ConcurrencyManager::focused_locked() {
    auto it = std::find_if(handles_.begin(), handles_.end(),
                           [](const ClientSessionHandle& handle) { return handle.is_focused; });
    return it == handles_.end() ? nullptr : &*it;
}

std::optional<std::string> ConcurrencyManager::hold_focused_except_locked(
    const std::string& leg_id) {
    auto* current = focused_locked();
    if (!current || current->leg_id == leg_id) {
        return std::nullopt;
    }
    if (current->status != HandleStatus::Open || current->is_held) {
        return std::nullopt;
    }
    device_->hold(current->leg_id, true);
    current->is_held = true;
    return current->leg_id;
}

void ConcurrencyManager::restore_held_locked(const std::optional<std::string>& leg_id) {
    if (!leg_id) {
        return;
    }
    auto* handle = find_locked(*leg_id);
    if (!handle || !handle->is_held) {
        return;
    }
    best_effort("restore held leg", [&] { device_->hold(*leg_id, false); });
    handle->is_held = false;
}

void ConcurrencyManager::set_focus_locked(const std::string& leg_id) {
    for (auto& handle : handles_) {
        handle.is_focused = handle.leg_id == leg_id;
    }
}

void ConcurrencyManager::remove_locked(const std::string& leg_id) {
    auto it = std::find_if(handles_.begin(), handles_.end(),
                           [&](const ClientSessionHandle& handle) { return handle.leg_id == leg_id; });
    if (it == handles_.end()) {
        return;
    }
    const bool was_focused = it->is_focused;
    handles_.erase(it);
    if (!was_focused || handles_.empty()) {
        return;
    }
    auto next = std::find_if(handles_.begin(), handles_.end(),
                             [](const ClientSessionHandle& handle) { return !handle.is_held; });
    if (next == handles_.end()) {
        next = handles_.begin();
    }
    next->is_focused = true;
}

bool ConcurrencyManager::add_locked(const std::string& leg_id,
                                    Direction direction,
                                    const std::string& from,
                                    const std::string& to) {
    if (find_locked(leg_id)) {
        return true;
    }
    if (static_cast<int>(handles_.size()) >= max_sessions_) {
        logging::warn("Concurrency bound reached, rejecting leg",
                      {kv("leg", leg_id), kv("bound", max_sessions_)});
        best_effort("reject leg over bound", [&] { device_->reject(leg_id); });
        return false;
    }
    ClientSessionHandle handle;
    handle.leg_id = leg_id;
    handle.direction = direction;
    handle.from = from;
    handle.to = to;
    handle.started_at = clock_();
    handle.is_focused = handles_.empty();
    handles_.push_back(std::move(handle));
    return true;
}

bool ConcurrencyManager::add_session(const std::string& leg_id,
                                     Direction direction,
                                     const std::string& from,
                                     const std::string& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_locked(leg_id, direction, from, to);
}

bool ConcurrencyManager::answer(const std::string& leg_id, bool hold_others) {
    ClientSessionHandle answered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* handle = find_locked(leg_id);
        if (!handle || handle->status != HandleStatus::Pending) {
            return false;
        }
        std::optional<std::string> held;
        if (hold_others) {
            held = hold_focused_except_locked(leg_id);
        }
        try {
            device_->accept(leg_id);
        } catch (const std::exception&) {
            restore_held_locked(held);
            throw;
        }
        handle = find_locked(leg_id);
        handle->status = HandleStatus::Open;
        handle->answered_at = clock_();
        set_focus_locked(leg_id);
        answered = *handle;
    }
    logging::info("Leg answered", {kv("leg", leg_id), kv("hold_others", hold_others)});
    sync("claim", answered, [](SessionSync& target, const ClientSessionHandle& h) { target.claim(h); });
    return true;
}

bool ConcurrencyManager::focus(const std::string& leg_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = find_locked(leg_id);
    if (!handle || handle->status == HandleStatus::Closed) {
        return false;
    }
    if (handle->is_focused && !handle->is_held) {
        return true;
    }
    const auto held = hold_focused_except_locked(leg_id);
    if (handle->is_held && handle->status == HandleStatus::Open) {
        try {
            device_->hold(leg_id, false);
        } catch (const std::exception&) {
            restore_held_locked(held);
            throw;
        }
        handle->is_held = false;
    }
    set_focus_locked(leg_id);
    return true;
}

bool ConcurrencyManager::hang_up(const std::string& leg_id) {
    ClientSessionHandle ended;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* handle = find_locked(leg_id);
        if (!handle) {
            return false;
        }
        best_effort("hang up leg", [&] { device_->disconnect(leg_id); });
        ended = *handle;
        ended.status = HandleStatus::Closed;
        remove_locked(leg_id);
    }
    sync("end", ended, [](SessionSync& target, const ClientSessionHandle& h) { target.end(h); });
    return true;
}

bool ConcurrencyManager::reject(const std::string& leg_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = find_locked(leg_id);
    if (!handle || handle->status != HandleStatus::Pending) {
        return false;
    }
    device_->reject(leg_id);
    remove_locked(leg_id);
    return true;
}

bool ConcurrencyManager::toggle_mute(const std::string& leg_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = find_locked(leg_id);
    if (!handle || handle->status == HandleStatus::Closed) {
        return false;
    }
    device_->mute(leg_id, !handle->is_muted);
    handle->is_muted = !handle->is_muted;
    return true;
}

bool ConcurrencyManager::hold(const std::string& leg_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = find_locked(leg_id);
    if (!handle || handle->is_held || handle->status != HandleStatus::Open) {
        return false;
    }
    device_->hold(leg_id, true);
    handle->is_held = true;
    return true;
}

bool ConcurrencyManager::unhold(const std::string& leg_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = find_locked(leg_id);
    if (!handle || !handle->is_held) {
        return false;
    }
    device_->hold(leg_id, false);
    handle->is_held = false;
    return true;
}

std::string ConcurrencyManager::dial(const std::string& destination,
                                     const std::string& from,
                                     std::optional<std::string> correlation_id) {
    ClientSessionHandle dialed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(handles_.size()) >= max_sessions_) {
            throw ResourceExhausted("Maximum concurrent calls reached (" +
                                    std::to_string(max_sessions_) + ")");
        }
        const auto held = hold_focused_except_locked("");
        std::string leg_id;
        try {
            leg_id = device_->ring(destination);
        } catch (const std::exception&) {
            restore_held_locked(held);
            throw;
        }
        ClientSessionHandle handle;
        handle.leg_id = leg_id;
        handle.status = HandleStatus::Connecting;
        handle.direction = Direction::Outbound;
        handle.from = from;
        handle.to = destination;
        handle.started_at = clock_();
        handle.correlation_id = std::move(correlation_id);
        handles_.push_back(handle);
        set_focus_locked(leg_id);
        dialed = handles_.back();
    }
    logging::info("Outbound leg dialed", {kv("leg", dialed.leg_id), kv("to", destination)});
    sync("begin_outbound", dialed,
         [](SessionSync& target, const ClientSessionHandle& h) { target.begin_outbound(h); });
    return dialed.leg_id;
}

void ConcurrencyManager::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handles_.empty()) {
        logging::warn("Dropping all legs", {kv("count", handles_.size())});
    }
    handles_.clear();
}

void ConcurrencyManager::handle_event(const ProviderEvent& event) {
    switch (event.type) {
        case LegEventType::Incoming:
            add_session(event.leg_id, event.direction, event.remote, event.local);
            return;
        case LegEventType::Accepted: {
            std::lock_guard<std::mutex> lock(mutex_);
            auto* handle = find_locked(event.leg_id);
            if (handle && handle->status != HandleStatus::Open) {
                handle->status = HandleStatus::Open;
                handle->answered_at = clock_();
            }
            return;
        }
        case LegEventType::Disconnected:
        case LegEventType::Cancelled:
        case LegEventType::Rejected: {
            std::lock_guard<std::mutex> lock(mutex_);
            if (find_locked(event.leg_id)) {
                logging::debug("Leg closed remotely",
                               {kv("leg", event.leg_id), kv("event", to_string(event.type))});
                remove_locked(event.leg_id);
            }
            return;
        }
    }
}

std::vector<ClientSessionHandle> ConcurrencyManager::handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_;
}

std::vector<ClientSessionHandle> ConcurrencyManager::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientSessionHandle> result;
    for (const auto& handle : handles_) {
        if (handle.status == HandleStatus::Pending) {
            result.push_back(handle);
        }
    }
    return result;
}

std::vector<ClientSessionHandle> ConcurrencyManager::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientSessionHandle> result;
    for (const auto& handle : handles_) {
        if (handle.status == HandleStatus::Open || handle.status == HandleStatus::Connecting) {
            result.push_back(handle);
        }
    }
    return result;
}

std::optional<ClientSessionHandle> ConcurrencyManager::focused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& handle : handles_) {
        if (handle.is_focused) {
            return handle;
        }
    }
    return std::nullopt;
}

std::size_t ConcurrencyManager::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

}
