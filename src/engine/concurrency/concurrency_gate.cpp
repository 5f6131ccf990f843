#include "concurrency_gate.hpp"
#include <algorithm>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>

namespace OpenCrawl {
namespace Engine {

ConcurrencyGate::Permit& ConcurrencyGate::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        gate_       = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

ConcurrencyGate::Permit::~Permit() {
    release();
}

void ConcurrencyGate::Permit::release() {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

ConcurrencyGate::ConcurrencyGate(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0)
        throw std::invalid_argument("ConcurrencyGate capacity must be at least 1");
}

boost::asio::awaitable<ConcurrencyGate::Permit> ConcurrencyGate::acquire() {
    if (in_use_ < capacity_ && waiters_.empty()) {
        ++in_use_;
        co_return Permit(this);
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto waiter   = std::make_shared<Waiter>(executor);
    waiters_.push_back(waiter);

    boost::system::error_code ec;
    co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (!waiter->granted) {
        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end())
            waiters_.erase(it);
        throw boost::system::system_error(boost::asio::error::operation_aborted);
    }
    // The slot was transferred by release() and is already counted.
    co_return Permit(this);
}

void ConcurrencyGate::release() {
    if (!waiters_.empty()) {
        auto next = waiters_.front();
        waiters_.pop_front();
        next->granted = true;
        next->timer.expires_at(boost::asio::steady_timer::time_point::min());
        return;
    }
    if (in_use_ > 0)
        --in_use_;
}

void ConcurrencyGate::cancel_waiters() {
    auto pending = std::move(waiters_);
    waiters_.clear();
    for (auto& waiter : pending)
        waiter->timer.cancel();
}

std::size_t ConcurrencyGate::capacity() const {
    return capacity_;
}

std::size_t ConcurrencyGate::in_use() const {
    return in_use_;
}

std::size_t ConcurrencyGate::waiting() const {
    return waiters_.size();
}

}  // namespace Engine
}  // namespace OpenCrawl
