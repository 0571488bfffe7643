#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace detail {

template <class T>
void append_stringified(std::string& str, T&& x) {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<U, char>) {
        str += x;
    } else if constexpr (std::is_same_v<U, bool>) {
        str += (x ? "true" : "false");
    } else if constexpr (std::is_arithmetic_v<U>) {
        str += std::to_string(x);
    } else {
        str += std::string_view{std::forward<T>(x)};
    }
}

} // namespace detail

template <class... Args>
std::string& back_insert(std::string& str, Args&&... args) {
    (detail::append_stringified(str, std::forward<Args>(args)), ...);
    return str;
}

template <class... Args>
std::string concat_tostr(Args&&... args) {
    std::string res;
    back_insert(res, std::forward<Args>(args)...);
    return res;
}
