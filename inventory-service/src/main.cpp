#include "InventoryApp.hpp"
#include <csignal>
#include <iostream>

namespace {

inventory::InventoryApp* runningApp = nullptr;

// Только атомарный флаг: вывод из обработчика сигнала небезопасен
void onTerminate(int) {
    if (runningApp) {
        runningApp->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "[main] Inventory Engine v1.0.0" << std::endl;

    int code = 1;
    try {
        inventory::InventoryApp app;
        runningApp = &app;
        std::signal(SIGINT, onTerminate);
        std::signal(SIGTERM, onTerminate);

        code = app.run(argc, argv);
        runningApp = nullptr;
    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal: " << e.what() << std::endl;
        return 2;
    }

    std::cout << "[main] Exit code " << code
              << (code == 0 ? " (ledger consistent)" : " (discrepancies found)") << std::endl;
    return code;
}
