#pragma once

#include <atomic>

// Cooperative cancellation flag shared between the caller and long-running
// fetch/extract loops. Loops poll it between chunks.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    // Throws PackgetException(Cancelled) when cancellation was requested.
    void cancellation_point() const;

private:
    std::atomic<bool> cancelled_{false};
};

// Routes SIGINT/SIGTERM to `token`. The token must outlive the handlers.
void install_signal_handlers(CancellationToken& token);
