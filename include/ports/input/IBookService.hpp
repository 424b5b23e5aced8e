#pragma once

#include "domain/Book.hpp"
#include <functional>
#include <vector>
#include <optional>

namespace library::ports::input {

/**
 * @brief Интерфейс сервиса каталога книг
 */
class IBookService {
public:
    virtual ~IBookService() = default;

    /**
     * @brief Все книги в порядке добавления
     *
     * Возвращает ссылку на живую коллекцию, а не копию.
     * Ссылка не защищена блокировкой: конкурентный addBook может
     * переаллоцировать вектор, и итерация по ней читает освобождённую память.
     * Для обхода из обработчиков запросов используйте forEachBook.
     */
    virtual const std::vector<domain::Book>& getAllBooks() = 0;

    /**
     * @brief Обойти книги в порядке добавления под блокировкой каталога
     *
     * visitor не должен вызывать методы сервиса (deadlock).
     */
    virtual void forEachBook(const std::function<void(const domain::Book&)>& visitor) = 0;

    /**
     * @brief Первая книга с данным id (при дубликатах)
     */
    virtual std::optional<domain::Book> getBookById(int id) = 0;

    /**
     * @brief Добавить книгу в конец каталога
     */
    virtual void addBook(const domain::Book& book) = 0;

    /**
     * @brief Удалить первую книгу с данным id, если есть
     */
    virtual void deleteBook(int id) = 0;
};

} // namespace library::ports::input
