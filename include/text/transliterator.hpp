#pragma once

#include <string>
#include <utility>
#include <vector>
#include <unicode/utypes.h>

namespace vg {

/**
 * @brief Buckwalter transliteration between Arabic script and ASCII
 *
 * The table is a strict bijection between a fixed set of Arabic letters and
 * diacritics and single ASCII symbols. Characters outside the table pass through
 * untouched in both directions, so mixed-script input does not round-trip.
 */
class Transliterator {
public:
    /**
     * @brief Arabic script -> Buckwalter
     * @throws TransliterationError if the input is not well-formed UTF-8
     */
    static std::string to_transliteration(const std::string& text);

    /**
     * @brief Buckwalter -> Arabic script
     * @throws TransliterationError if the input is not well-formed UTF-8
     */
    static std::string to_source(const std::string& text);

    static bool is_source_char(UChar32 code_point);
    static bool is_transliteration_char(char symbol);

    /**
     * @brief The forward table in declaration order (source code point, ASCII symbol)
     */
    static const std::vector<std::pair<UChar32, char>>& table();
};

} // namespace vg
