#pragma once

#include "ports/input/IBookService.hpp"
#include "settings/CatalogSettings.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <iostream>

namespace library::application {

/**
 * @brief In-memory каталог книг
 *
 * Единственный экземпляр живёт в DI как singleton, от старта процесса
 * до выхода. Операции сериализуются одним общим mutex, других гарантий
 * (транзакций, порядка между запросами) нет.
 *
 * Дубликаты id допускаются: getBookById и deleteBook работают
 * с первым совпадением в порядке добавления.
 */
class BookService : public ports::input::IBookService {
public:
    explicit BookService(std::shared_ptr<settings::CatalogSettings> settings)
    {
        if (settings->isSeedEnabled()) {
            books_.emplace_back(1, "1984", "George Orwell");
            books_.emplace_back(2, "To Kill a Mockingbird", "Harper Lee");
        }
        std::cout << "[BookService] Created with " << books_.size() << " books" << std::endl;
    }

    /**
     * @brief Живая коллекция каталога
     *
     * Ссылка не защищена mutex. При конкурентных запросах обходить
     * каталог через forEachBook.
     */
    const std::vector<domain::Book>& getAllBooks() override {
        return books_;
    }

    void forEachBook(const std::function<void(const domain::Book&)>& visitor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& book : books_) {
            visitor(book);
        }
    }

    std::optional<domain::Book> getBookById(int id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findFirst(id);
        if (it == books_.end()) return std::nullopt;
        return *it;
    }

    void addBook(const domain::Book& book) override {
        std::lock_guard<std::mutex> lock(mutex_);
        books_.push_back(book);
    }

    void deleteBook(int id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findFirst(id);
        if (it != books_.end()) {
            books_.erase(it);
        }
    }

private:
    std::mutex mutex_;
    std::vector<domain::Book> books_;

    std::vector<domain::Book>::iterator findFirst(int id) {
        return std::find_if(books_.begin(), books_.end(),
            [id](const domain::Book& b) { return b.id == id; });
    }
};

} // namespace library::application
