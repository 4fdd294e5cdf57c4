#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "switchboard/store/record_store.hpp"
#include "switchboard/transfer/transfer_coordinator.hpp"

namespace switchboard {

// Background loop timing out ringing transfers and ringing entries past their deadline.
class ExpirySweeper {
public:
    ExpirySweeper(std::shared_ptr<SessionRecordStore> store,
                  std::shared_ptr<TransferCoordinator> transfers,
                  std::chrono::milliseconds interval,
                  int cleanup_every = 60);
    ~ExpirySweeper();

    void start();
    void stop();

    // One pass; safe to call while the loop runs.
    void sweep();

private:
    void run();

    std::shared_ptr<SessionRecordStore> store_;
    std::shared_ptr<TransferCoordinator> transfers_;
    std::chrono::milliseconds interval_;
    int cleanup_every_;
    int ticks_ = 0;

    std::mutex mutex_;
    std::mutex sweep_mutex_;
    std::condition_variable wake_;
    bool running_ = false;
    std::thread thread_;
};

}
