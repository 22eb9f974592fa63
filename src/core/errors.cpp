#include "core/errors.hpp"

namespace vg {

std::string describe_exception(const std::exception& e) {
    std::string message = e.what();

    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        message += ": " + describe_exception(inner);
    } catch (...) {
        message += ": unknown error";
    }

    return message;
}

} // namespace vg
