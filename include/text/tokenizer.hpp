#pragma once

#include <string>
#include <utility>
#include <vector>
#include <unicode/utypes.h>

namespace vg {

/// Default word delimiter for verse text
inline const std::string kDefaultDelimiter = " ";

/**
 * @brief Splits verse text into ordered word tokens
 *
 * Text is split on a literal delimiter, then ASCII punctuation and the Arabic
 * comma and question mark are trimmed from both ends of every piece. Pieces that
 * end up empty are dropped; the order of the remaining tokens is the source order.
 */
class Tokenizer {
public:
    /**
     * @throws TokenizationError on an empty delimiter or ill-formed UTF-8
     */
    static std::vector<std::string> tokenize(const std::string& text,
                                             const std::string& delimiter = kDefaultDelimiter);

    /**
     * @brief Tokens paired with their zero-based index in the token sequence
     */
    static std::vector<std::pair<std::string, size_t>> tokenize_with_positions(
        const std::string& text,
        const std::string& delimiter = kDefaultDelimiter
    );

    static size_t count_words(const std::string& text,
                              const std::string& delimiter = kDefaultDelimiter);

    static bool is_boundary_char(UChar32 code_point);
};

} // namespace vg
