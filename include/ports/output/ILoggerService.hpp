#pragma once

#include <string>

namespace library::ports::output {

/**
 * @brief Журнал обращений к каталогу
 *
 * Одна человекочитаемая строка на вызов.
 */
class ILoggerService {
public:
    virtual ~ILoggerService() = default;

    virtual void log(const std::string& message) = 0;
};

} // namespace library::ports::output
