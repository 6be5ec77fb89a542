#pragma once

#include <atomic>
#include <csignal>
#include <mutex>
#include <string>

/**
 * Cooperative cancellation for collection scans.
 * - Scans poll isCancellationRequested() between groups, never mid-group
 * - The first request wins; later requests keep the original reason
 * - bindToSignals() routes SIGINT/SIGTERM to a token through
 *   async-signal-safe flags polled by pollSignals()
 * - A bound token unbinds itself when destroyed; signals arriving after
 *   that are consumed without cancelling anything
 */
class CancellationToken
{
public:
    CancellationToken() = default;
    ~CancellationToken();
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel(const std::string &reason) noexcept;

    bool isCancellationRequested() const noexcept
    {
        pollSignals();
        return cancelled_.load();
    }

    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

    // Install SIGINT/SIGTERM handlers that cancel the bound token
    static void bindToSignals(CancellationToken &token);

    // True while token is the one receiving signals
    static bool isBoundToSignals(const CancellationToken &token) noexcept
    {
        return bound_token_.load() == &token;
    }

private:
    static void handleSignal(int sig) noexcept;

    // Translate a pending signal into a cancellation of the bound token
    static void pollSignals() noexcept;

    std::atomic<bool> cancelled_{false};
    std::string reason_;
    mutable std::mutex mutex_;

    static std::atomic<CancellationToken *> bound_token_;
    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
