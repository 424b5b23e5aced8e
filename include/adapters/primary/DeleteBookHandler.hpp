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
     * @brief DELETE /api/books/{id} — удалить книгу
     *
     * Роутер регистрирует с паттерном "/api/books/*"
     * Всегда 204 без тела, даже если книги не было.
     */
    class DeleteBookHandler : public IHttpHandler
    {
    public:
        DeleteBookHandler(
            std::shared_ptr<ports::input::IBookService> bookService,
            std::shared_ptr<ports::output::ILoggerService> logger) : bookService_(std::move(bookService)), logger_(std::move(logger))
        {
            std::cout << "[DeleteBookHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "DELETE")
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

                bookService_->deleteBook(*id);
                logger_->log("DELETE book " + std::to_string(*id));

                res.setStatus(204);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[DeleteBookHandler] Error: " << e.what() << std::endl;
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
