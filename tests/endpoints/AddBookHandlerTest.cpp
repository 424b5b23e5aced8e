/**
 * @file AddBookHandlerTest.cpp
 * @brief Unit-тесты для AddBookHandler
 *
 * POST /api/books — добавить книгу
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/AddBookHandler.hpp"
#include "mocks/MockBookService.hpp"
#include "mocks/MockLoggerService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <limits>

using namespace library;
using namespace library::adapters::primary;
using namespace library::tests::mocks;
using ::testing::_;
using ::testing::Throw;

class AddBookHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockService_ = std::make_shared<MockBookService>();
        mockLogger_ = std::make_shared<::testing::NiceMock<MockLoggerService>>();
        handler_ = std::make_unique<AddBookHandler>(mockService_, mockLogger_);
    }

    SimpleRequest createRequest(const std::string &method, const std::string &body)
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath("/api/books");
        req.setHeader("Content-Type", "application/json");
        req.setBody(body);
        return req;
    }

    std::shared_ptr<MockBookService> mockService_;
    std::shared_ptr<::testing::NiceMock<MockLoggerService>> mockLogger_;
    std::unique_ptr<AddBookHandler> handler_;
};

TEST_F(AddBookHandlerTest, ValidBook_Returns201WithBookAndLocation)
{
    EXPECT_CALL(*mockService_, addBook(domain::Book(3, "Dune", "Frank Herbert")))
        .Times(1);

    auto req = createRequest("POST", R"({"id": 3, "title": "Dune", "author": "Frank Herbert"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);

    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["id"], 3);
    EXPECT_EQ(json["title"], "Dune");
    EXPECT_EQ(json["author"], "Frank Herbert");

    auto location = res.getHeader("Location");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(*location, "/api/books/3");
}

TEST_F(AddBookHandlerTest, MissingFields_AcceptedWithDefaults)
{
    EXPECT_CALL(*mockService_, addBook(domain::Book(0, "", ""))).Times(1);

    auto req = createRequest("POST", "{}");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
}

TEST_F(AddBookHandlerTest, DuplicateId_StillAccepted)
{
    // Уникальность id не проверяется — сервис вызывается всегда
    EXPECT_CALL(*mockService_, addBook(domain::Book(1, "Animal Farm", "George Orwell"))).Times(1);

    auto req = createRequest("POST", R"({"id": 1, "title": "Animal Farm", "author": "George Orwell"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
}

TEST_F(AddBookHandlerTest, LogsIdAndTitle)
{
    EXPECT_CALL(*mockLogger_, log("POST book 3 \"Dune\"")).Times(1);

    auto req = createRequest("POST", R"({"id": 3, "title": "Dune", "author": "Frank Herbert"})");
    SimpleResponse res;

    handler_->handle(req, res);
}

TEST_F(AddBookHandlerTest, InvalidJson_Returns400)
{
    EXPECT_CALL(*mockService_, addBook(_)).Times(0);

    auto req = createRequest("POST", "{not json");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Invalid JSON");
}

TEST_F(AddBookHandlerTest, WrongFieldType_Returns400)
{
    EXPECT_CALL(*mockService_, addBook(_)).Times(0);

    auto req = createRequest("POST", R"({"id": "three", "title": "Dune"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AddBookHandlerTest, IdAboveIntRange_Returns400)
{
    // 4294967299 не должно превратиться в 3 при приведении к int
    EXPECT_CALL(*mockService_, addBook(_)).Times(0);

    auto req = createRequest("POST", R"({"id": 4294967299, "title": "Dune", "author": "Frank Herbert"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["error"], "Invalid JSON");
}

TEST_F(AddBookHandlerTest, IdBelowIntRange_Returns400)
{
    EXPECT_CALL(*mockService_, addBook(_)).Times(0);

    auto req = createRequest("POST", R"({"id": -3000000000, "title": "Dune"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AddBookHandlerTest, FractionalId_Returns400)
{
    EXPECT_CALL(*mockService_, addBook(_)).Times(0);

    auto req = createRequest("POST", R"({"id": 3.9, "title": "Dune", "author": "Frank Herbert"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AddBookHandlerTest, IdAtIntBounds_Accepted)
{
    EXPECT_CALL(*mockService_, addBook(domain::Book(std::numeric_limits<int>::max(), "Max", ""))).Times(1);
    EXPECT_CALL(*mockService_, addBook(domain::Book(std::numeric_limits<int>::min(), "Min", ""))).Times(1);

    SimpleResponse maxRes;
    auto maxReq = createRequest("POST", R"({"id": 2147483647, "title": "Max"})");
    handler_->handle(maxReq, maxRes);

    SimpleResponse minRes;
    auto minReq = createRequest("POST", R"({"id": -2147483648, "title": "Min"})");
    handler_->handle(minReq, minRes);

    EXPECT_EQ(maxRes.getStatus(), 201);
    EXPECT_EQ(minRes.getStatus(), 201);

    auto location = maxRes.getHeader("Location");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(*location, "/api/books/2147483647");
}

TEST_F(AddBookHandlerTest, GetMethod_Returns405)
{
    EXPECT_CALL(*mockService_, addBook(_)).Times(0);

    auto req = createRequest("GET", "");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

TEST_F(AddBookHandlerTest, ServiceThrows_Returns500)
{
    EXPECT_CALL(*mockService_, addBook(_))
        .WillOnce(Throw(std::runtime_error("boom")));

    auto req = createRequest("POST", R"({"id": 3, "title": "Dune", "author": "Frank Herbert"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}
