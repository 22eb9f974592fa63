#pragma once

#include <string>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace vg {

/**
 * @brief Decode UTF-8 into an ICU string, rejecting ill-formed input
 *
 * @param text UTF-8 input
 * @param out Receives the decoded UTF-16 string
 * @param error_message Set when decoding fails
 * @return false if the input is not well-formed UTF-8
 */
bool decode_utf8(const std::string& text, icu::UnicodeString& out, std::string& error_message);

/**
 * @brief Encode an ICU string back to UTF-8
 */
std::string encode_utf8(const icu::UnicodeString& text);

/**
 * @brief Encode a single code point as UTF-8
 */
std::string encode_code_point(UChar32 code_point);

} // namespace vg
