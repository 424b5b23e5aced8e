#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include "ports/input/IBookService.hpp"
#include <cstddef>
#include <memory>

namespace library {

/**
 * @class LibraryApp
 * @brief Главное приложение сервиса каталога книг
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка конфигурации в Environment
 * 2. configureInjection() - регистрация сервисов и handlers через Boost.DI
 * 3. start() - запуск HTTP сервера (из базового класса)
 */
class LibraryApp : public BoostBeastApplication
{
public:
    LibraryApp();
    ~LibraryApp() override;

    /**
     * @brief Число книг в каталоге; 0, пока DI не настроен
     */
    std::size_t catalogSize() const;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    /**
     * @brief Настроить DI контейнер и зарегистрировать handlers
     *
     * - GET /health           → HealthHandler
     * - GET /api/books        → GetBooksHandler
     * - GET /api/books/*      → GetBookHandler
     * - POST /api/books       → AddBookHandler
     * - DELETE /api/books/*   → DeleteBookHandler
     */
    void configureInjection() override;

private:
    // Тот же singleton, что получают handlers
    std::shared_ptr<ports::input::IBookService> bookService_;
};

} // namespace library
