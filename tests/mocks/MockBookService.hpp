#pragma once

#include "ports/input/IBookService.hpp"
#include <gmock/gmock.h>

namespace library::tests::mocks {

class MockBookService : public ports::input::IBookService {
public:
    MOCK_METHOD(const std::vector<domain::Book>&, getAllBooks, (), (override));
    MOCK_METHOD(void, forEachBook, (const std::function<void(const domain::Book&)>& visitor), (override));
    MOCK_METHOD(std::optional<domain::Book>, getBookById, (int id), (override));
    MOCK_METHOD(void, addBook, (const domain::Book& book), (override));
    MOCK_METHOD(void, deleteBook, (int id), (override));
};

} // namespace library::tests::mocks
