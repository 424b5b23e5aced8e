#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBookService.hpp"
#include "ports/output/ILoggerService.hpp"
#include "adapters/primary/BookJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace library::adapters::primary
{

    /**
     * @brief GET /api/books — все книги каталога
     *
     * Response (200 OK):
     * [
     *   {"id": 1, "title": "1984", "author": "George Orwell"},
     *   {"id": 2, "title": "To Kill a Mockingbird", "author": "Harper Lee"}
     * ]
     */
    class GetBooksHandler : public IHttpHandler
    {
    public:
        GetBooksHandler(
            std::shared_ptr<ports::input::IBookService> bookService,
            std::shared_ptr<ports::output::ILoggerService> logger) : bookService_(std::move(bookService)), logger_(std::move(logger))
        {
            std::cout << "[GetBooksHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                logger_->log("GET all books");

                // Сериализуем под блокировкой каталога: конкурентный POST
                // не должен переаллоцировать вектор посреди обхода
                nlohmann::json response = nlohmann::json::array();
                bookService_->forEachBook([&response](const domain::Book &book)
                                          { response.push_back(bookToJson(book)); });

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetBooksHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IBookService> bookService_;
        std::shared_ptr<ports::output::ILoggerService> logger_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace library::adapters::primary
