#pragma once

#include "domain/Book.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace library::adapters::primary {

/**
 * @brief Book → {"id": ..., "title": ..., "author": ...}
 */
inline nlohmann::json bookToJson(const domain::Book& book) {
    nlohmann::json j;
    j["id"] = book.id;
    j["title"] = book.title;
    j["author"] = book.author;
    return j;
}

/**
 * @brief Тело POST /api/books → Book
 *
 * Отсутствующие поля заменяются на 0 / "".
 * id должен быть целым в диапазоне int: дробное или слишком большое
 * число даёт std::nullopt, а не усечённое значение.
 * Поле неверного JSON-типа (title: 5) бросает nlohmann::json::type_error.
 */
inline std::optional<domain::Book> bookFromJson(const nlohmann::json& body) {
    domain::Book book;

    auto it = body.find("id");
    if (it != body.end()) {
        if (!it->is_number_integer()) return std::nullopt;

        if (it->is_number_unsigned()) {
            auto v = it->get<std::uint64_t>();
            if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
            book.id = static_cast<int>(v);
        } else {
            auto v = it->get<std::int64_t>();
            if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
            book.id = static_cast<int>(v);
        }
    }

    book.title = body.value("title", "");
    book.author = body.value("author", "");
    return book;
}

/**
 * @brief Целое число из сегмента пути, без хвостового мусора ("12abc" невалидно)
 */
inline std::optional<int> parseBookId(const std::string& raw) {
    if (raw.empty()) return std::nullopt;

    try {
        size_t pos = 0;
        int id = std::stoi(raw, &pos);
        if (pos != raw.size()) return std::nullopt;
        return id;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace library::adapters::primary
