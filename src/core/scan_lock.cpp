#include "core/scan_lock.hpp"
#include "logging/logger.hpp"

ScanLock &ScanLock::getInstance()
{
    static ScanLock instance;
    return instance;
}

ScanLock::Guard ScanLock::tryAcquire()
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto self = std::this_thread::get_id();
    if (hold_count_ > 0 && owner_ != self)
    {
        Logger::debug("Scan lock held by another thread");
        return Guard();
    }

    owner_ = self;
    ++hold_count_;
    return Guard(this);
}

bool ScanLock::isHeld() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hold_count_ > 0;
}

int ScanLock::holdCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hold_count_;
}

void ScanLock::release()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (hold_count_ == 0)
    {
        return;
    }
    if (--hold_count_ == 0)
    {
        owner_ = std::thread::id();
    }
}

ScanLock::Guard::~Guard()
{
    release();
}

ScanLock::Guard::Guard(Guard &&other) noexcept : lock_(other.lock_)
{
    other.lock_ = nullptr;
}

ScanLock::Guard &ScanLock::Guard::operator=(Guard &&other) noexcept
{
    if (this != &other)
    {
        release();
        lock_ = other.lock_;
        other.lock_ = nullptr;
    }
    return *this;
}

void ScanLock::Guard::release()
{
    if (lock_)
    {
        lock_->release();
        lock_ = nullptr;
    }
}
