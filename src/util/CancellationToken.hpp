/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between caller and worker
 */

#pragma once

#include <atomic>

namespace util {

/**
 * @class CancellationToken
 * @brief Checkable, settable cancellation signal
 *
 * The caller (UI, CLI signal handler, test) calls cancel(); the worker polls
 * is_cancelled() at the top of every pass and once per chunk. The flag is a
 * lock-free atomic, so cancel() is safe to call from a signal handler.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
    static_assert(std::atomic<bool>::is_always_lock_free);
};

}  // namespace util
