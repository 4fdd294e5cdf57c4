#pragma once

#include <functional>
#include <string>

namespace switchboard::utils {

// Runs the task on a detached thread. Exceptions are logged under the given name.
void run_async(std::function<void()> task, std::string name = "async");

}
