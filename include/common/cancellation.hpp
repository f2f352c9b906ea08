#pragma once

#include <atomic>

namespace tempo {

/**
 * @brief Cooperative cancellation signal
 *
 * Long operations poll the token between BFS levels and between analysis
 * windows. They never block on it and never throw when it fires.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }
    void reset() { cancelled_.store(false, std::memory_order_release); }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Null-safe helper used by the engines, which accept an optional token
    static bool requested(const CancellationToken* token) {
        return token != nullptr && token->is_cancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace tempo
