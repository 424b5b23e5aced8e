#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IBookService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace library::adapters::primary
{

    /**
     * @brief GET /health — живость сервиса и состояние каталога
     *
     * Response (200 OK):
     * {
     *   "status": "healthy",
     *   "service": "library-service",
     *   "version": "1.0.0",
     *   "catalog": {"books": 2}
     * }
     */
    class HealthHandler : public IHttpHandler
    {
    public:
        explicit HealthHandler(std::shared_ptr<ports::input::IBookService> bookService)
            : bookService_(std::move(bookService))
        {
            std::cout << "[HealthHandler] Created" << std::endl;
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
                size_t books = 0;
                bookService_->forEachBook([&books](const domain::Book &)
                                          { ++books; });

                nlohmann::json response;
                response["status"] = "healthy";
                response["service"] = "library-service";
                response["version"] = "1.0.0";
                response["catalog"]["books"] = books;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                // Каталог недоступен — сервис не здоров
                std::cerr << "[HealthHandler] Error: " << e.what() << std::endl;
                nlohmann::json response;
                response["status"] = "unhealthy";
                response["service"] = "library-service";
                res.setResult(503, "application/json", response.dump());
            }
        }

    private:
        std::shared_ptr<ports::input::IBookService> bookService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace library::adapters::primary
