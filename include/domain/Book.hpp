#pragma once

#include <string>

namespace library::domain {

/**
 * @brief Книга в каталоге
 *
 * id назначает вызывающая сторона, сервис его не генерирует.
 * Уникальность id не проверяется.
 */
class Book {
public:
    int id;
    std::string title;
    std::string author;

    Book() : id(0) {}

    Book(int i, const std::string& t, const std::string& a)
        : id(i), title(t), author(a)
    {}

    bool operator==(const Book& other) const {
        return id == other.id && title == other.title && author == other.author;
    }
};

} // namespace library::domain
