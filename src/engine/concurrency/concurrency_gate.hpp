#pragma once
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <deque>
#include <memory>

namespace OpenCrawl {
namespace Engine {

/**
 * @brief Counting admission gate for coroutines on one executor.
 *
 * acquire() suspends until a slot is free and returns a Permit that gives
 * the slot back when destroyed, so every exit path of the holder releases it.
 * Waiters are admitted in FIFO order. Not thread-safe.
 */
class ConcurrencyGate {
    struct Waiter {
        explicit Waiter(const boost::asio::any_io_executor& executor)
            : timer(executor, boost::asio::steady_timer::time_point::max()) {
        }
        boost::asio::steady_timer timer;
        bool                      granted = false;
    };

public:
    class Permit {
    public:
        Permit() = default;
        explicit Permit(ConcurrencyGate* gate) : gate_(gate) {
        }
        Permit(Permit&& other) noexcept : gate_(other.gate_) {
            other.gate_ = nullptr;
        }
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&)            = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit();

        void release();
        bool held() const {
            return gate_ != nullptr;
        }

    private:
        ConcurrencyGate* gate_ = nullptr;
    };

    explicit ConcurrencyGate(std::size_t capacity);

    // Throws boost::system::system_error(operation_aborted) when the wait is
    // cancelled by cancel_waiters().
    boost::asio::awaitable<Permit> acquire();

    // Fails every pending acquire(); permits already handed out stay valid.
    void cancel_waiters();

    std::size_t capacity() const;
    std::size_t in_use() const;
    std::size_t waiting() const;

private:
    void release();

    std::size_t                         capacity_;
    std::size_t                         in_use_ = 0;
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

}  // namespace Engine
}  // namespace OpenCrawl
