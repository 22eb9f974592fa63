#include "text/transliterator.hpp"
#include "text/unicode.hpp"
#include "core/errors.hpp"
#include <unicode/utf16.h>
#include <unordered_map>

namespace {

const std::vector<std::pair<UChar32, char>> kBuckwalterTable = {
    // Letters
    {0x0621, '\''},     // hamza
    {0x0622, '|'},      // alef with madda
    {0x0623, '>'},      // alef with hamza above
    {0x0624, '&'},      // waw with hamza
    {0x0625, '<'},      // alef with hamza below
    {0x0626, '}'},      // yeh with hamza
    {0x0627, 'A'},      // alef
    {0x0628, 'b'},      // beh
    {0x0629, 'p'},      // teh marbuta
    {0x062A, 't'},      // teh
    {0x062B, 'v'},      // theh
    {0x062C, 'j'},      // jeem
    {0x062D, 'H'},      // hah
    {0x062E, 'x'},      // khah
    {0x062F, 'd'},      // dal
    {0x0630, '*'},      // thal
    {0x0631, 'r'},      // reh
    {0x0632, 'z'},      // zain
    {0x0633, 's'},      // seen
    {0x0634, '$'},      // sheen
    {0x0635, 'S'},      // sad
    {0x0636, 'D'},      // dad
    {0x0637, 'T'},      // tah
    {0x0638, 'Z'},      // zah
    {0x0639, 'E'},      // ain
    {0x063A, 'g'},      // ghain
    {0x0640, '_'},      // tatweel
    {0x0641, 'f'},      // feh
    {0x0642, 'q'},      // qaf
    {0x0643, 'k'},      // kaf
    {0x0644, 'l'},      // lam
    {0x0645, 'm'},      // meem
    {0x0646, 'n'},      // noon
    {0x0647, 'h'},      // heh
    {0x0648, 'w'},      // waw
    {0x0649, 'Y'},      // alef maksura
    {0x064A, 'y'},      // yeh

    // Diacritics
    {0x064B, 'F'},      // fathatan
    {0x064C, 'N'},      // dammatan
    {0x064D, 'K'},      // kasratan
    {0x064E, 'a'},      // fatha
    {0x064F, 'u'},      // damma
    {0x0650, 'i'},      // kasra
    {0x0651, '~'},      // shadda
    {0x0652, 'o'},      // sukun
    {0x0653, '^'},      // maddah
    {0x0654, '#'},      // hamza above
    {0x0670, '`'},      // superscript alef

    {0x0671, '{'},      // alef wasla
};

struct TransliterationMaps {
    std::unordered_map<UChar32, char> forward;
    std::unordered_map<char, UChar32> reverse;
};

TransliterationMaps build_maps() {
    TransliterationMaps maps;
    for (const auto& [code_point, symbol] : kBuckwalterTable) {
        maps.forward.emplace(code_point, symbol);
        maps.reverse.emplace(symbol, code_point);
    }

    // A duplicate on either side would make the reverse direction lossy
    if (maps.forward.size() != kBuckwalterTable.size() ||
        maps.reverse.size() != kBuckwalterTable.size()) {
        throw vg::TransliterationError("Transliteration table is not a bijection");
    }

    return maps;
}

const TransliterationMaps& maps() {
    static const TransliterationMaps instance = build_maps();
    return instance;
}

icu::UnicodeString decode_or_throw(const std::string& text, const std::string& direction) {
    icu::UnicodeString decoded;
    std::string error;
    if (!vg::decode_utf8(text, decoded, error)) {
        throw vg::TransliterationError("Failed to convert " + direction + ": " + error);
    }
    return decoded;
}

}  // namespace

namespace vg {

std::string Transliterator::to_transliteration(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    const auto& forward = maps().forward;
    icu::UnicodeString decoded = decode_or_throw(text, "to transliteration");

    icu::UnicodeString result;
    for (int32_t i = 0; i < decoded.length(); ) {
        UChar32 c = decoded.char32At(i);
        i += U16_LENGTH(c);

        auto it = forward.find(c);
        if (it != forward.end()) {
            result.append(static_cast<UChar32>(static_cast<unsigned char>(it->second)));
        } else {
            result.append(c);
        }
    }

    return encode_utf8(result);
}

std::string Transliterator::to_source(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    const auto& reverse = maps().reverse;
    icu::UnicodeString decoded = decode_or_throw(text, "from transliteration");

    icu::UnicodeString result;
    for (int32_t i = 0; i < decoded.length(); ) {
        UChar32 c = decoded.char32At(i);
        i += U16_LENGTH(c);

        if (c < 0x80) {
            auto it = reverse.find(static_cast<char>(c));
            if (it != reverse.end()) {
                result.append(it->second);
                continue;
            }
        }
        result.append(c);
    }

    return encode_utf8(result);
}

bool Transliterator::is_source_char(UChar32 code_point) {
    return maps().forward.count(code_point) > 0;
}

bool Transliterator::is_transliteration_char(char symbol) {
    return maps().reverse.count(symbol) > 0;
}

const std::vector<std::pair<UChar32, char>>& Transliterator::table() {
    return kBuckwalterTable;
}

} // namespace vg
