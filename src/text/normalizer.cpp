#include "text/normalizer.hpp"
#include "text/unicode.hpp"
#include "core/errors.hpp"
#include <unicode/utf16.h>
#include <unordered_map>

namespace {

// Marker for "delete this code point"
constexpr UChar32 kDelete = -1;

using SubstitutionTable = std::unordered_map<UChar32, UChar32>;

const SubstitutionTable& diacritic_table() {
    static const SubstitutionTable table = {
        {0x064B, kDelete},  // fathatan
        {0x064C, kDelete},  // dammatan
        {0x064D, kDelete},  // kasratan
        {0x064E, kDelete},  // fatha
        {0x064F, kDelete},  // damma
        {0x0650, kDelete},  // kasra
        {0x0651, kDelete},  // shadda
        {0x0652, kDelete},  // sukun
        {0x0653, kDelete},  // maddah above
        {0x0654, kDelete},  // hamza above
        {0x0655, kDelete},  // hamza below
        {0x0656, kDelete},  // subscript alef
        {0x0657, kDelete},  // inverted damma
        {0x0658, kDelete},  // mark noon ghunna
        {0x0670, kDelete},  // superscript alef
    };
    return table;
}

const SubstitutionTable& hamza_table() {
    static const SubstitutionTable table = {
        {0x0623, 0x0627},   // alef with hamza above -> alef
        {0x0625, 0x0627},   // alef with hamza below -> alef
        {0x0622, 0x0627},   // alef with madda -> alef
        {0x0624, 0x0648},   // waw with hamza -> waw
        {0x0626, 0x064A},   // yeh with hamza -> yeh
    };
    return table;
}

const SubstitutionTable& alef_table() {
    static const SubstitutionTable table = {
        {0x0623, 0x0627},
        {0x0625, 0x0627},
        {0x0622, 0x0627},
        {0x0671, 0x0627},   // alef wasla -> alef
    };
    return table;
}

const SubstitutionTable& taa_marbuta_table() {
    static const SubstitutionTable table = {
        {0x0629, 0x0647},   // taa marbuta -> heh
    };
    return table;
}

std::string apply_table(const std::string& text,
                        const SubstitutionTable& table,
                        const std::string& step) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString decoded;
    std::string error;
    if (!vg::decode_utf8(text, decoded, error)) {
        throw vg::NormalizationError("Failed to " + step + ": " + error);
    }

    icu::UnicodeString result;
    for (int32_t i = 0; i < decoded.length(); ) {
        UChar32 c = decoded.char32At(i);
        i += U16_LENGTH(c);

        auto it = table.find(c);
        if (it == table.end()) {
            result.append(c);
        } else if (it->second != kDelete) {
            result.append(it->second);
        }
    }

    return vg::encode_utf8(result);
}

}  // namespace

namespace vg {

// ============================================================================
// NormalizationOptions
// ============================================================================

nlohmann::json NormalizationOptions::to_json() const {
    nlohmann::json j;
    j["remove_diacritics"] = remove_diacritics;
    j["fold_hamza"] = fold_hamza;
    j["fold_alef"] = fold_alef;
    j["fold_taa_marbuta"] = fold_taa_marbuta;
    return j;
}

NormalizationOptions NormalizationOptions::from_json(const nlohmann::json& j) {
    NormalizationOptions options;
    options.remove_diacritics = j.value("remove_diacritics", true);
    options.fold_hamza = j.value("fold_hamza", true);
    options.fold_alef = j.value("fold_alef", true);
    options.fold_taa_marbuta = j.value("fold_taa_marbuta", true);
    return options;
}

bool NormalizationOptions::operator==(const NormalizationOptions& other) const {
    return remove_diacritics == other.remove_diacritics &&
           fold_hamza == other.fold_hamza &&
           fold_alef == other.fold_alef &&
           fold_taa_marbuta == other.fold_taa_marbuta;
}

// ============================================================================
// Normalizer
// ============================================================================

std::string Normalizer::normalize(const std::string& text, const NormalizationOptions& options) {
    if (text.empty()) {
        return text;
    }

    try {
        std::string result = text;

        // Diacritics go first: hamza above/below marks sit on letters the folds rewrite
        if (options.remove_diacritics) {
            result = remove_diacritics(result);
        }
        if (options.fold_hamza) {
            result = fold_hamza(result);
        }
        if (options.fold_alef) {
            result = fold_alef(result);
        }
        if (options.fold_taa_marbuta) {
            result = fold_taa_marbuta(result);
        }

        return result;
    } catch (const NormalizationError&) {
        std::throw_with_nested(NormalizationError("Failed to normalize text"));
    }
}

std::string Normalizer::remove_diacritics(const std::string& text) {
    return apply_table(text, diacritic_table(), "remove diacritics");
}

std::string Normalizer::fold_hamza(const std::string& text) {
    return apply_table(text, hamza_table(), "normalize hamza");
}

std::string Normalizer::fold_alef(const std::string& text) {
    return apply_table(text, alef_table(), "normalize alef");
}

std::string Normalizer::fold_taa_marbuta(const std::string& text) {
    return apply_table(text, taa_marbuta_table(), "normalize taa marbuta");
}

bool Normalizer::is_diacritic(UChar32 code_point) {
    return diacritic_table().count(code_point) > 0;
}

} // namespace vg
