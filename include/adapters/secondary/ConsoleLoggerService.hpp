#pragma once

#include "ports/output/ILoggerService.hpp"
#include <ostream>
#include <string>

namespace library::adapters::secondary {

/**
 * @class ConsoleLoggerService
 * @brief Пишет журнал обращений к каталогу в поток вывода
 *
 * Формат строки:
 * [LoggerService] 2026-10-19 14:05:31: GET all books
 *
 * Время локальное. По умолчанию пишет в std::cout.
 */
class ConsoleLoggerService : public ports::output::ILoggerService
{
public:
    ConsoleLoggerService();
    explicit ConsoleLoggerService(std::ostream& out);

    void log(const std::string& message) override;

private:
    std::ostream& out_;

    /**
     * @brief Текущее локальное время в формате YYYY-MM-DD HH:MM:SS
     */
    std::string getCurrentTimestamp() const;
};

} // namespace library::adapters::secondary
