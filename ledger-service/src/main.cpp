#include "LedgerApp.hpp"
#include <csignal>
#include <iostream>

namespace {

ledger::LedgerApp* runningApp = nullptr;

void onTerminate(int signal) {
    std::cout << "\n[main] Signal " << signal << ": draining and stopping ledger" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ledger::LedgerApp app;
        runningApp = &app;
        std::signal(SIGINT, onTerminate);
        std::signal(SIGTERM, onTerminate);

        std::cout << "[main] ledger-service 1.0.0" << std::endl;
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] ledger-service exited" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] ledger-service failed to start: " << e.what() << std::endl;
        return 1;
    }
}
