#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

// spawn every task, wait for all of them, results come back in input order.
// a task that throws is turned into a result by on_error(index, exception), siblings keep running.
// must be awaited from a single threaded executor (or a strand), completions are not synchronised.
template <typename T, typename OnError>
boost::asio::awaitable<std::vector<T>> gather(std::vector<boost::asio::awaitable<T>> tasks, OnError on_error) {
    auto exec = co_await boost::asio::this_coro::executor;

    struct State {
        std::vector<T> results;
        std::size_t pending;
        boost::asio::steady_timer done;

        State(boost::asio::any_io_executor ex, std::size_t n): results(n), pending(n), done(ex, boost::asio::steady_timer::time_point::max()) {}
    };

    auto state = std::make_shared<State>(exec, tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        boost::asio::co_spawn(exec, std::move(tasks[i]),
            [state, i, on_error](std::exception_ptr ep, T value) mutable {
                state->results[i] = ep ? on_error(i, ep) : std::move(value);
                if (--state->pending == 0) state->done.cancel();
            });
    }

    if (state->pending > 0) {
        boost::system::error_code ec;
        co_await state->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    co_return std::move(state->results);
}
