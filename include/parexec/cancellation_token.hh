#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>

namespace parexec {

// Cooperative cancellation of a single step (compilation or execution). The
// step owning the token polls it and kills its process group once the token
// is cancelled or its deadline passes. A token may be chained to a parent
// token (e.g. one cancelled from a signal handler thread), cancelling or
// expiring the parent affects the child as well.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
    const CancellationToken* parent_ = nullptr;

public:
    // Never expires, only explicit cancel() stops it
    CancellationToken() = default;

    explicit CancellationToken(const CancellationToken* parent) noexcept : parent_(parent) {}

    CancellationToken(std::chrono::nanoseconds timeout, const CancellationToken* parent = nullptr)
    : deadline_(Clock::now() + timeout)
    , parent_(parent) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken& operator=(CancellationToken&&) = delete;

    ~CancellationToken() = default;

    // Thread-safe
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire) or
            (parent_ != nullptr and parent_->cancelled());
    }

    // Returns the earliest deadline in the chain
    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept {
        auto parent_deadline = (parent_ ? parent_->deadline() : std::nullopt);
        if (deadline_ and parent_deadline) {
            return std::min(*deadline_, *parent_deadline);
        }
        return deadline_ ? deadline_ : parent_deadline;
    }

    [[nodiscard]] bool expired() const noexcept {
        auto dl = deadline();
        return dl and Clock::now() >= *dl;
    }

    // Time left until the deadline, std::nullopt if there is no deadline
    [[nodiscard]] std::optional<std::chrono::nanoseconds> remaining() const noexcept {
        auto dl = deadline();
        if (not dl) {
            return std::nullopt;
        }
        return std::max(
            std::chrono::nanoseconds::zero(),
            std::chrono::duration_cast<std::chrono::nanoseconds>(*dl - Clock::now())
        );
    }
};

} // namespace parexec
