#include "config.hpp"
#include "service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <memory>

// Global pointer to the service to allow signal handler to access it
std::unique_ptr<Service> service_ptr;

void signal_handler(int signum) {
    spdlog::info("Caught signal {}, shutting down...", signum);
    if (service_ptr) {
        service_ptr->stop();
    }
}

int main() {
    try {
        Config config = Config::from_env();
        util::setup_logging(config.service_name, config.log_level);
        config.validate();
        spdlog::info("Starting {}...", config.service_name);

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        service_ptr = std::make_unique<Service>(config);
        service_ptr->run();
        service_ptr.reset();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("factcheck service has shut down gracefully.");
    return 0;
}
