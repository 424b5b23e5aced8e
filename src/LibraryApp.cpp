#include "LibraryApp.hpp"

// Settings
#include "settings/CatalogSettings.hpp"

// Ports
#include "ports/input/IBookService.hpp"
#include "ports/output/ILoggerService.hpp"

// Application
#include "application/BookService.hpp"

// Secondary Adapters
#include "adapters/secondary/ConsoleLoggerService.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/GetBooksHandler.hpp"
#include "adapters/primary/GetBookHandler.hpp"
#include "adapters/primary/AddBookHandler.hpp"
#include "adapters/primary/DeleteBookHandler.hpp"

#include <iostream>
#include <boost/di.hpp>

namespace di = boost::di;

namespace library {

LibraryApp::LibraryApp()
{
    std::cout << "[LibraryApp] Initializing..." << std::endl;
}

LibraryApp::~LibraryApp()
{
    std::cout << "[LibraryApp] Shutting down..." << std::endl;
}

std::size_t LibraryApp::catalogSize() const
{
    if (!bookService_) {
        return 0;
    }

    std::size_t count = 0;
    bookService_->forEachBook([&count](const domain::Book&) { ++count; });
    return count;
}

void LibraryApp::loadEnvironment(int argc, char* argv[])
{
    BoostBeastApplication::loadEnvironment(argc, argv);
    std::cout << "[LibraryApp] Environment loaded" << std::endl;
}

void LibraryApp::configureInjection()
{
    std::cout << "[LibraryApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(
        // Settings
        di::bind<settings::CatalogSettings>().in(di::singleton),

        // Secondary Adapters (Output Ports)
        di::bind<ports::output::ILoggerService>()
            .to(std::make_shared<adapters::secondary::ConsoleLoggerService>()),

        // Application Services (Input Ports)
        // Каталог — один экземпляр на весь процесс
        di::bind<ports::input::IBookService>()
            .to<application::BookService>()
            .in(di::singleton)
    );

    bookService_ = injector.create<std::shared_ptr<ports::input::IBookService>>();
    std::cout << "[LibraryApp] Catalog ready: " << catalogSize() << " books" << std::endl;

    // Primary Adapters (HTTP Handlers)
    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
        registerEndpoint("GET", "/health", handler);
        std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::GetBooksHandler>>();
        registerEndpoint("GET", "/api/books", handler);
        std::cout << "  ✓ GetBooksHandler: GET /api/books" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::GetBookHandler>>();
        registerEndpoint("GET", "/api/books/*", handler);
        std::cout << "  ✓ GetBookHandler: GET /api/books/*" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::AddBookHandler>>();
        registerEndpoint("POST", "/api/books", handler);
        std::cout << "  ✓ AddBookHandler: POST /api/books" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::DeleteBookHandler>>();
        registerEndpoint("DELETE", "/api/books/*", handler);
        std::cout << "  ✓ DeleteBookHandler: DELETE /api/books/*" << std::endl;
    }

    std::cout << "[LibraryApp] Configuration complete! 5 handlers registered." << std::endl;
}

} // namespace library
