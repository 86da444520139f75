#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/transfer/types.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <string>
#include <type_traits>

namespace chanfs::transfer {

/**
 * @brief Bounded retry with linear backoff around one remote operation
 *
 * Attempt i (0-based) that fails waits (i + 1) backoff units before attempt
 * i + 1. Nothing is waited after the last attempt. Exhaustion yields a
 * terminal error carrying the attempt count and the last failure message.
 *
 * The operation must be self-contained: everything it sends is captured by
 * the callable, so every attempt resends the same bytes.
 *
 * USAGE:
 * RetryPolicy retry(options);
 * auto sent = retry.run("block 3", [&] { return remote.send_message(id, "3", payload); });
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// Called before each backoff wait with the 1-based failed attempt number
    using RetryObserver = std::function<void(std::size_t attempt,
                                             std::chrono::milliseconds wait,
                                             const Error& error)>;

    explicit RetryPolicy(RetryOptions options, Sleeper sleeper = {});

    void set_observer(RetryObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] std::size_t max_attempts() const noexcept;
    [[nodiscard]] std::chrono::milliseconds backoff_for(std::size_t failed_attempt) const noexcept;

    template<typename Operation>
    std::invoke_result_t<Operation&> run(const std::string& what,
                                         Operation&& operation,
                                         ErrorCode terminal_code = ErrorCode::RemoteWriteError) const {
        using ResultType = std::invoke_result_t<Operation&>;

        const std::size_t attempts = max_attempts();
        Error last_error;
        for (std::size_t i = 0; i < attempts; ++i) {
            ResultType result = operation();
            if (result.is_ok()) {
                return result;
            }
            last_error = result.error();

            if (i + 1 < attempts) {
                const auto wait = backoff_for(i);
                spdlog::warn("{}: attempt {} failed, retrying in {}ms: {}",
                             what, i + 1, wait.count(), last_error.message);
                if (observer_) {
                    observer_(i + 1, wait, last_error);
                }
                sleeper_(wait);
            }
        }

        return ResultType(ErrValue<Error>(make_error(
            terminal_code,
            what + ": failed after " + std::to_string(attempts) + " attempts: " + last_error.message)));
    }

private:
    RetryOptions options_;
    Sleeper sleeper_;
    RetryObserver observer_;
};

} // namespace chanfs::transfer
