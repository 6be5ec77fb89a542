#include "core/cancellation_token.hpp"
#include "logging/logger.hpp"

std::atomic<CancellationToken *> CancellationToken::bound_token_{nullptr};
volatile sig_atomic_t CancellationToken::signal_flag_ = 0;
volatile sig_atomic_t CancellationToken::signal_num_ = 0;

CancellationToken::~CancellationToken()
{
    CancellationToken *self = this;
    bound_token_.compare_exchange_strong(self, nullptr);
}

void CancellationToken::cancel(const std::string &reason) noexcept
{
    if (cancelled_.exchange(true))
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
    }
    Logger::info("Scan cancellation requested - " + reason);
}

std::string CancellationToken::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void CancellationToken::reset() noexcept
{
    std::lock_guard<std::mutex> lk(mutex_);
    cancelled_.store(false);
    reason_.clear();
}

void CancellationToken::bindToSignals(CancellationToken &token)
{
    bound_token_.store(&token);
    signal(SIGINT, &CancellationToken::handleSignal);
    signal(SIGTERM, &CancellationToken::handleSignal);
    Logger::debug("CancellationToken: signal handlers installed");
}

void CancellationToken::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void CancellationToken::pollSignals() noexcept
{
    if (!signal_flag_)
    {
        return;
    }
    int sig = signal_num_;
    signal_flag_ = 0;

    CancellationToken *token = bound_token_.load();
    if (token)
    {
        token->cancel("Signal " + std::to_string(sig) + " received");
    }
}
