#include <iostream>
#include <csignal>
#include <exception>
#include "core/CommandLine.h"
#include "core/HubService.h"
#include "utils/Logger.h"

namespace {
volatile std::sig_atomic_t stopSignal = 0;

void onSignal(int sig) {
    stopSignal = sig;
}
} // namespace

int main(int argc, char* argv[]) {
    HubOptions options;
    try {
        options = parseHubArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "mcphub: " << e.what() << "\n" << hubUsage();
        return 1;
    }
    if (options.help) {
        std::cout << hubUsage();
        return 0;
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        HubService hub(options);
        hub.configure();

        if (auto running = hub.findRunningHub()) {
            Logger::getInstance().info("Reusing hub " + std::to_string(running->pid) + " on port " +
                                       std::to_string(running->port));
            std::cout << running->port << std::endl;
            return 0;
        }

        hub.start();
        if (options.socketPath.empty()) std::cout << hub.getPort() << std::endl;

        hub.run([]() { return stopSignal != 0; });
        if (stopSignal != 0) {
            Logger::getInstance().info("Received signal " + std::to_string(stopSignal) + ", shutting down");
        }
        hub.shutdown();
    } catch (const std::exception& e) {
        Logger::getInstance().error(e.what());
        std::cerr << "mcphub: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
