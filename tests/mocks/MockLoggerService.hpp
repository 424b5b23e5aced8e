#pragma once

#include "ports/output/ILoggerService.hpp"
#include <gmock/gmock.h>

namespace library::tests::mocks {

class MockLoggerService : public ports::output::ILoggerService {
public:
    MOCK_METHOD(void, log, (const std::string& message), (override));
};

} // namespace library::tests::mocks
