#include "text/unicode.hpp"
#include <unicode/ustring.h>
#include <unicode/utf16.h>
#include <limits>

namespace vg {

bool decode_utf8(const std::string& text, icu::UnicodeString& out, std::string& error_message) {
    out.remove();
    if (text.empty()) {
        return true;
    }

    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        error_message = "input too large";
        return false;
    }
    const auto source_length = static_cast<int32_t>(text.size());

    // Preflight to get the UTF-16 length; ill-formed input fails here
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = 0;
    u_strFromUTF8(nullptr, 0, &length, text.data(), source_length, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        error_message = std::string("ill-formed UTF-8 (") + u_errorName(status) + ")";
        return false;
    }

    status = U_ZERO_ERROR;
    UChar* buffer = out.getBuffer(length);
    if (buffer == nullptr) {
        error_message = "failed to allocate decode buffer";
        return false;
    }
    u_strFromUTF8(buffer, length, nullptr, text.data(), source_length, &status);
    out.releaseBuffer(U_SUCCESS(status) ? length : 0);

    if (U_FAILURE(status)) {
        error_message = std::string("ill-formed UTF-8 (") + u_errorName(status) + ")";
        return false;
    }

    return true;
}

std::string encode_utf8(const icu::UnicodeString& text) {
    std::string result;
    text.toUTF8String(result);
    return result;
}

std::string encode_code_point(UChar32 code_point) {
    return encode_utf8(icu::UnicodeString(code_point));
}

} // namespace vg
