#pragma once
#include <system_error>

namespace fragcast {

enum class errc {
    record_too_large = 1,
    message_too_large,
    malformed_datagram
};

const std::error_category& error_category();

inline std::error_code make_error_code(errc e) {
    return std::error_code(static_cast<int>(e), error_category());
}

} // namespace fragcast

namespace std {
template <>
struct is_error_code_enum<fragcast::errc> : true_type {};
} // namespace std
