#pragma once

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string_view>

// Fixed-size buffer, so that it is usable between fork() and exec()
class ErrMsg {
    std::array<char, 160> buff_{};
    size_t len_ = 0;

public:
    void append(std::string_view str) noexcept {
        size_t n = std::min(str.size(), buff_.size() - 1 - len_);
        std::memcpy(buff_.data() + len_, str.data(), n);
        len_ += n;
        buff_[len_] = '\0';
    }

    [[nodiscard]] const char* data() const noexcept { return buff_.data(); }

    [[nodiscard]] size_t size() const noexcept { return len_; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator std::string_view() const noexcept { return {buff_.data(), len_}; }
};

// Returns " - <description> (os error <errnum>)"
inline ErrMsg errmsg(int errnum) noexcept {
    ErrMsg res;
    res.append(" - ");
    std::array<char, 96> descr{};
    // GNU strerror_r() may return a static string instead of filling descr
    const char* errstr = strerror_r(errnum, descr.data(), descr.size());
    res.append(errstr == nullptr ? "Unknown error" : errstr);
    res.append(" (os error ");
    std::array<char, 16> num{};
    auto [ptr, ec] = std::to_chars(num.data(), num.data() + num.size(), errnum);
    if (ec == std::errc{}) {
        res.append({num.data(), static_cast<size_t>(ptr - num.data())});
    }
    res.append(")");
    return res;
}

inline ErrMsg errmsg() noexcept { return errmsg(errno); }
