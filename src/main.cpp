#include "switchboard/app.hpp"
#include "switchboard/config.hpp"
#include "switchboard/logging.hpp"

#include <csignal>
#include <string>

namespace {

switchboard::SwitchboardApp* g_app = nullptr;

void on_signal(int) {
    if (g_app) {
        g_app->request_stop();
    }
}

}

int main() {
    try {
        const auto config = switchboard::Config::load();
        config.validate();
        switchboard::logging::init(config);
        switchboard::info(
            "Starting switchboard",
            {switchboard::kv("sip_user", config.sip_user),
             switchboard::kv("rest_port", config.rest_api_port),
             switchboard::kv("dashboard_port", config.dashboard_ws_port),
             switchboard::kv("database", config.database_path.string()),
             switchboard::kv("parking_slots", config.parking_slots)});
        switchboard::SwitchboardApp app(config);
        g_app = &app;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        app.init();
        app.run();
        app.stop();
        g_app = nullptr;
    } catch (const std::exception& ex) {
        g_app = nullptr;
        switchboard::error(
            "Startup failed",
            {switchboard::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
