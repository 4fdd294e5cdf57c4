#include "switchboard/transfer/expiry_sweeper.hpp"

#include <exception>
#include <utility>

#include "switchboard/logging.hpp"

namespace switchboard {

ExpirySweeper::ExpirySweeper(std::shared_ptr<SessionRecordStore> store,
                             std::shared_ptr<TransferCoordinator> transfers,
                             std::chrono::milliseconds interval,
                             int cleanup_every)
    : store_(std::move(store)),
      transfers_(std::move(transfers)),
      interval_(interval),
      cleanup_every_(cleanup_every > 0 ? cleanup_every : 1) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this]() { run(); });
    logging::info("Expiry sweeper started", {kv("interval_ms", interval_.count())});
}

void ExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ExpirySweeper::sweep() {
    std::lock_guard<std::mutex> guard(sweep_mutex_);
    const auto timed_out = transfers_->expire_due();
    const auto expired = store_->expire_ringing();
    if (!timed_out.empty() || !expired.empty()) {
        logging::info("Expired ringing entities",
                      {kv("transfers", timed_out.size()), kv("ringing", expired.size())});
    }
    if (++ticks_ % cleanup_every_ == 0) {
        const auto removed = store_->cleanup_ringing();
        if (removed > 0) {
            logging::debug("Purged ringing entries", {kv("count", removed)});
        }
    }
}

void ExpirySweeper::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        wake_.wait_for(lock, interval_, [this]() { return !running_; });
        if (!running_) {
            break;
        }
        lock.unlock();
        try {
            sweep();
        } catch (const std::exception& ex) {
            logging::error("Expiry sweep failed", {kv("error", ex.what())});
        }
        lock.lock();
    }
}

}
