#pragma once

#include <mutex>
#include <thread>

/**
 * @brief Process-wide advisory lock allowing at most one scan at a time
 *
 * Re-entrant for the owning thread: nested acquisitions increase a
 * reference count and the lock is released when the last guard goes away.
 */
class ScanLock
{
public:
    class Guard
    {
    public:
        Guard() = default;
        ~Guard();
        Guard(Guard &&other) noexcept;
        Guard &operator=(Guard &&other) noexcept;
        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;

        explicit operator bool() const { return lock_ != nullptr; }

    private:
        friend class ScanLock;
        explicit Guard(ScanLock *lock) : lock_(lock) {}
        void release();

        ScanLock *lock_{nullptr};
    };

    static ScanLock &getInstance();

    /**
     * @brief Acquire without blocking
     * @return Empty guard when another thread currently holds the lock
     */
    Guard tryAcquire();

    bool isHeld() const;
    int holdCount() const;

    ScanLock() = default;
    ScanLock(const ScanLock &) = delete;
    ScanLock &operator=(const ScanLock &) = delete;

private:
    void release();

    mutable std::mutex mutex_;
    std::thread::id owner_;
    int hold_count_{0};
};
