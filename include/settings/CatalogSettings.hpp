#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace library::settings {

/**
 * @brief Настройки каталога
 *
 * Читает из ENV:
 * - CATALOG_SEED (default: true) — заполнять ли каталог начальными книгами
 */
class CatalogSettings {
public:
    CatalogSettings() {
        if (const char* val = std::getenv("CATALOG_SEED")) {
            std::string v(val);
            std::transform(v.begin(), v.end(), v.begin(),
                           [](unsigned char c) { return std::tolower(c); });

            if (v == "false" || v == "0" || v == "no" || v == "off") {
                seedEnabled_ = false;
            }
            // Любое другое значение оставляет default
        }
    }

    bool isSeedEnabled() const { return seedEnabled_; }

private:
    bool seedEnabled_ = true;
};

} // namespace library::settings
