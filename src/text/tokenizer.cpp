#include "text/tokenizer.hpp"
#include "text/unicode.hpp"
#include "core/errors.hpp"
#include <cstring>

namespace {

constexpr UChar32 kArabicComma = 0x060C;
constexpr UChar32 kArabicQuestionMark = 0x061F;
constexpr const char* kAsciiBoundary = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

std::string trim_boundary(const std::string& piece) {
    icu::UnicodeString decoded;
    std::string error;
    if (!vg::decode_utf8(piece, decoded, error)) {
        throw vg::TokenizationError("Failed to tokenize: " + error);
    }

    // Boundary characters are all in the BMP, so surrogate halves never match
    int32_t start = 0;
    int32_t end = decoded.length();
    while (start < end && vg::Tokenizer::is_boundary_char(decoded.charAt(start))) {
        ++start;
    }
    while (end > start && vg::Tokenizer::is_boundary_char(decoded.charAt(end - 1))) {
        --end;
    }

    if (start == 0 && end == decoded.length()) {
        return piece;
    }
    return vg::encode_utf8(decoded.tempSubStringBetween(start, end));
}

}  // namespace

namespace vg {

std::vector<std::string> Tokenizer::tokenize(const std::string& text, const std::string& delimiter) {
    std::vector<std::string> tokens;
    if (text.empty()) {
        return tokens;
    }
    if (delimiter.empty()) {
        throw TokenizationError("Failed to tokenize: empty delimiter");
    }

    size_t begin = 0;
    while (true) {
        size_t pos = text.find(delimiter, begin);
        std::string piece = text.substr(begin, pos == std::string::npos ? std::string::npos : pos - begin);

        std::string word = trim_boundary(piece);
        if (!word.empty()) {
            tokens.push_back(std::move(word));
        }

        if (pos == std::string::npos) {
            break;
        }
        begin = pos + delimiter.size();
    }

    return tokens;
}

std::vector<std::pair<std::string, size_t>> Tokenizer::tokenize_with_positions(
    const std::string& text,
    const std::string& delimiter
) {
    std::vector<std::pair<std::string, size_t>> result;
    auto tokens = tokenize(text, delimiter);
    result.reserve(tokens.size());

    for (size_t i = 0; i < tokens.size(); ++i) {
        result.emplace_back(std::move(tokens[i]), i);
    }

    return result;
}

size_t Tokenizer::count_words(const std::string& text, const std::string& delimiter) {
    return tokenize(text, delimiter).size();
}

bool Tokenizer::is_boundary_char(UChar32 code_point) {
    if (code_point == kArabicComma || code_point == kArabicQuestionMark) {
        return true;
    }
    return code_point > 0 && code_point < 0x80 &&
           std::strchr(kAsciiBoundary, static_cast<int>(code_point)) != nullptr;
}

} // namespace vg
