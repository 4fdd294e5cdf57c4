#pragma once

#include <functional>
#include <string>

namespace switchboard::pjsip {

// pjlib refuses calls from threads it has not seen; every entry point registers first.
void ensure_thread_registered(const char* name);

// Runs the task off the pjsip callback thread, registered with pjlib.
void post(std::function<void()> task, std::string name = "sb_pj_async");

}
