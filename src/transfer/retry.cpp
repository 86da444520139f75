#include "chanfs/transfer/retry.hpp"

#include <thread>

namespace chanfs::transfer {

RetryPolicy::RetryPolicy(RetryOptions options, Sleeper sleeper)
    : options_(options),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds wait) { std::this_thread::sleep_for(wait); };
    }
}

std::size_t RetryPolicy::max_attempts() const noexcept {
    return options_.max_attempts == 0 ? 1 : options_.max_attempts;
}

std::chrono::milliseconds RetryPolicy::backoff_for(std::size_t failed_attempt) const noexcept {
    return options_.backoff_unit * static_cast<std::chrono::milliseconds::rep>(failed_attempt + 1);
}

} // namespace chanfs::transfer
