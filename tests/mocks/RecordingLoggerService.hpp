#pragma once

#include "ports/output/ILoggerService.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace library::tests::mocks {

/**
 * @brief Логгер, запоминающий сообщения, для интеграционных тестов
 */
class RecordingLoggerService : public ports::output::ILoggerService {
public:
    void log(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(message);
    }

    // Test helpers
    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

} // namespace library::tests::mocks
