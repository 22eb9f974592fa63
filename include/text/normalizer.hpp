#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <unicode/utypes.h>

namespace vg {

/**
 * @brief Independently switchable normalization steps
 */
struct NormalizationOptions {
    bool remove_diacritics = true;     ///< Strip harakat and other combining marks
    bool fold_hamza = true;            ///< Hamza-carrying letters -> bare carrier
    bool fold_alef = true;             ///< Alef variants (incl. wasla) -> bare alef
    bool fold_taa_marbuta = true;      ///< Taa marbuta -> heh

    nlohmann::json to_json() const;
    static NormalizationOptions from_json(const nlohmann::json& j);

    bool operator==(const NormalizationOptions& other) const;
};

/**
 * @brief Deterministic character-level canonicalization of Arabic-script text
 *
 * Every step is a fixed code point substitution table (a code point either maps
 * to another code point or is deleted). normalize() applies the enabled steps in
 * a fixed order: diacritics, hamza, alef, taa marbuta. The result is idempotent:
 * no step produces a code point that any step would rewrite.
 */
class Normalizer {
public:
    /**
     * @brief Apply all enabled steps in order
     * @throws NormalizationError naming the failing step (input is not UTF-8)
     */
    static std::string normalize(const std::string& text,
                                 const NormalizationOptions& options = {});

    static std::string remove_diacritics(const std::string& text);
    static std::string fold_hamza(const std::string& text);
    static std::string fold_alef(const std::string& text);
    static std::string fold_taa_marbuta(const std::string& text);

    static bool is_diacritic(UChar32 code_point);
};

} // namespace vg
