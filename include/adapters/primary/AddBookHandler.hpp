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
     * @brief POST /api/books — добавить книгу
     *
     * Request:
     * {"id": 3, "title": "Dune", "author": "Frank Herbert"}
     *
     * Response (201 Created), Location: /api/books/3
     * {"id": 3, "title": "Dune", "author": "Frank Herbert"}
     *
     * Отсутствующие поля заменяются на 0 / "", дубликат id принимается.
     * id дробный или вне диапазона int — 400, без усечения.
     */
    class AddBookHandler : public IHttpHandler
    {
    public:
        AddBookHandler(
            std::shared_ptr<ports::input::IBookService> bookService,
            std::shared_ptr<ports::output::ILoggerService> logger) : bookService_(std::move(bookService)), logger_(std::move(logger))
        {
            std::cout << "[AddBookHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                auto parsed = bookFromJson(body);
                if (!parsed)
                {
                    // id дробный или не помещается в int
                    sendError(res, 400, "Invalid JSON");
                    return;
                }
                const domain::Book &book = *parsed;

                bookService_->addBook(book);
                logger_->log("POST book " + std::to_string(book.id) + " \"" + book.title + "\"");

                res.setHeader("Location", "/api/books/" + std::to_string(book.id));
                res.setResult(201, "application/json", bookToJson(book).dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[AddBookHandler] Error: " << e.what() << std::endl;
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
