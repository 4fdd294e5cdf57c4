#include "switchboard/telephony/pjsip/pj_thread.hpp"

#include <pj/os.h>

#include <utility>

#include "switchboard/utils/async.hpp"

namespace switchboard::pjsip {

void ensure_thread_registered(const char* name) {
    if (pj_thread_is_registered()) {
        return;
    }
    thread_local pj_thread_desc desc;
    pj_thread_t* thread = nullptr;
    pj_thread_register(name ? name : "switchboard", desc, &thread);
}

void post(std::function<void()> task, std::string name) {
    utils::run_async(
        [task = std::move(task)]() {
            ensure_thread_registered("sb_pj_async");
            task();
        },
        std::move(name));
}

}
