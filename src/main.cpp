#include "LibraryApp.hpp"
#include "settings/CatalogSettings.hpp"
#include <iostream>
#include <csignal>

namespace {

library::LibraryApp* g_app = nullptr;

void onShutdownSignal(int signal)
{
    std::cout << "\n[main] Signal " << signal << ": stopping HTTP server" << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

void printBanner(const library::settings::CatalogSettings& catalog)
{
    std::cout << "========================================" << std::endl;
    std::cout << "  Library Service v1.0.0" << std::endl;
    std::cout << "  Catalog: in-memory, "
              << (catalog.isSeedEnabled() ? "seeded with 2 books" : "empty (CATALOG_SEED=false)")
              << std::endl;
    std::cout << "  Endpoints: /api/books, /api/books/{id}, /health" << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        library::LibraryApp app;
        g_app = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        printBanner(library::settings::CatalogSettings());

        // loadEnvironment() → configureInjection() → start()
        app.run(argc, argv);
        g_app = nullptr;

        // Каталог живёт только в памяти: всё, что в нём было, теряется здесь
        std::cout << "[main] Library Service stopped, " << app.catalogSize()
                  << " books discarded" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
