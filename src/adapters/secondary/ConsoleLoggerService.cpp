#include "adapters/secondary/ConsoleLoggerService.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace library::adapters::secondary {

ConsoleLoggerService::ConsoleLoggerService()
    : out_(std::cout)
{
}

ConsoleLoggerService::ConsoleLoggerService(std::ostream& out)
    : out_(out)
{
}

void ConsoleLoggerService::log(const std::string& message)
{
    // Собираем строку целиком, чтобы одна запись ушла в поток одним вызовом
    std::ostringstream line;
    line << "[LoggerService] " << getCurrentTimestamp() << ": " << message << "\n";

    out_ << line.str() << std::flush;
}

std::string ConsoleLoggerService::getCurrentTimestamp() const
{
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    // localtime_r: std::localtime делит статический буфер между потоками handlers
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) {
        return "unknown-time";
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace library::adapters::secondary
