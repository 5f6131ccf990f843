#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace OpenCrawl {
namespace Core {

template <typename T>
using TaskFactory = std::function<boost::asio::awaitable<T>()>;

/**
 * @brief Runs every task concurrently on the calling coroutine's executor and
 * waits for all of them.
 *
 * Results are returned in task order regardless of completion order. If any
 * task throws, the first exception is rethrown once every task has finished.
 */
template <typename T>
boost::asio::awaitable<std::vector<T>> gather(std::vector<TaskFactory<T>> tasks) {
    struct State {
        explicit State(boost::asio::any_io_executor ex, size_t n)
            : results(n), remaining(n), done(ex, boost::asio::steady_timer::time_point::max()) {
        }
        std::vector<std::optional<T>> results;
        size_t                        remaining;
        std::exception_ptr            first_error;
        boost::asio::steady_timer     done;
    };

    auto executor = co_await boost::asio::this_coro::executor;
    auto state    = std::make_shared<State>(executor, tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i) {
        boost::asio::co_spawn(
            executor, tasks[i](), [state, i](std::exception_ptr error, T value) {
                if (error) {
                    if (!state->first_error)
                        state->first_error = error;
                }
                else {
                    state->results[i] = std::move(value);
                }
                if (--state->remaining == 0) {
                    // min() also completes a wait that has not started yet.
                    state->done.expires_at(boost::asio::steady_timer::time_point::min());
                }
            });
    }

    if (state->remaining > 0) {
        boost::system::error_code ec;
        co_await state->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (state->first_error)
        std::rethrow_exception(state->first_error);

    std::vector<T> out;
    out.reserve(state->results.size());
    for (auto& slot : state->results)
        out.push_back(std::move(*slot));
    co_return out;
}

}  // namespace Core
}  // namespace OpenCrawl
