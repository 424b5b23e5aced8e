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
     * @brief GET /api/books/{id} — книга по ID
     *
     * Роутер регистрирует с паттерном "/api/books/*"
     * Отсутствие книги — 404 с пустым телом.
     */
    class GetBookHandler : public IHttpHandler
    {
    public:
        GetBookHandler(
            std::shared_ptr<ports::input::IBookService> bookService,
            std::shared_ptr<ports::output::ILoggerService> logger) : bookService_(std::move(bookService)), logger_(std::move(logger))
        {
            std::cout << "[GetBookHandler] Created" << std::endl;
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
                auto id = parseBookId(req.getPathParam(0).value_or(""));
                if (!id)
                {
                    sendError(res, 400, "Invalid book id");
                    return;
                }

                auto book = bookService_->getBookById(*id);
                if (!book)
                {
                    logger_->log("GET book " + std::to_string(*id) + " - not found");
                    res.setStatus(404);
                    return;
                }

                logger_->log("GET book " + std::to_string(*id));
                res.setResult(200, "application/json", bookToJson(*book).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetBookHandler] Error: " << e.what() << std::endl;
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
