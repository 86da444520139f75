#include "chanfs/transfer/retry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using chanfs::Err;
using chanfs::ErrorCode;
using chanfs::Ok;
using chanfs::Result;
using chanfs::transfer::RetryOptions;
using chanfs::transfer::RetryPolicy;
using std::chrono::milliseconds;

namespace {

RetryOptions options(std::size_t attempts) {
    RetryOptions retry;
    retry.max_attempts = attempts;
    retry.backoff_unit = milliseconds{1000};
    return retry;
}

milliseconds total(const std::vector<milliseconds>& waits) {
    milliseconds sum{0};
    for (auto wait : waits) {
        sum += wait;
    }
    return sum;
}

} // namespace

TEST(RetryPolicyTest, SucceedsAfterTransientFailures) {
    std::vector<milliseconds> waits;
    RetryPolicy retry(options(10), [&](milliseconds wait) { waits.push_back(wait); });

    int calls = 0;
    auto result = retry.run("block 1", [&]() -> Result<int> {
        if (++calls <= 3) {
            return Err<int>(ErrorCode::RemoteWriteError, "503 service unavailable");
        }
        return Ok(7);
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(waits, (std::vector<milliseconds>{milliseconds{1000}, milliseconds{2000}, milliseconds{3000}}));
}

TEST(RetryPolicyTest, GivesUpAfterMaxAttemptsWithLinearBackoff) {
    std::vector<milliseconds> waits;
    RetryPolicy retry(options(10), [&](milliseconds wait) { waits.push_back(wait); });

    int calls = 0;
    auto result = retry.run("block 4", [&]() -> Result<int> {
        ++calls;
        return Err<int>(ErrorCode::RemoteWriteError, "connection reset");
    });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::RemoteWriteError);
    EXPECT_EQ(result.error().message, "block 4: failed after 10 attempts: connection reset");
    EXPECT_EQ(calls, 10);
    // No wait after the final attempt: 1 + 2 + ... + 9 units
    EXPECT_EQ(waits.size(), 9u);
    EXPECT_EQ(total(waits), milliseconds{45000});
}

TEST(RetryPolicyTest, TerminalCodeCanBeChosen) {
    RetryPolicy retry(options(2), [](milliseconds) {});

    auto result = retry.run("fetch", [] {
        return Err<std::string>(ErrorCode::RemoteReadError, "404");
    }, ErrorCode::RemoteReadError);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::RemoteReadError);
}

TEST(RetryPolicyTest, ZeroAttemptsMeansOne) {
    std::vector<milliseconds> waits;
    RetryPolicy retry(options(0), [&](milliseconds wait) { waits.push_back(wait); });
    EXPECT_EQ(retry.max_attempts(), 1u);

    int calls = 0;
    auto result = retry.run("block 1", [&]() -> Result<void> {
        ++calls;
        return Err<void>(ErrorCode::RemoteWriteError, "down");
    });

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(waits.empty());
}

TEST(RetryPolicyTest, ObserverSeesEveryScheduledRetry) {
    RetryPolicy retry(options(3), [](milliseconds) {});

    std::vector<std::size_t> attempts;
    std::vector<std::string> errors;
    retry.set_observer([&](std::size_t attempt, milliseconds, const chanfs::Error& error) {
        attempts.push_back(attempt);
        errors.push_back(error.message);
    });

    int calls = 0;
    auto result = retry.run("block 2", [&]() -> Result<void> {
        ++calls;
        return Err<void>(ErrorCode::RemoteWriteError, "try " + std::to_string(calls));
    });

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(attempts, (std::vector<std::size_t>{1, 2}));
    EXPECT_EQ(errors, (std::vector<std::string>{"try 1", "try 2"}));
}

TEST(RetryPolicyTest, BackoffGrowsByOneUnitPerAttempt) {
    RetryOptions retry_options;
    retry_options.backoff_unit = milliseconds{250};
    RetryPolicy retry(retry_options);

    EXPECT_EQ(retry.backoff_for(0), milliseconds{250});
    EXPECT_EQ(retry.backoff_for(3), milliseconds{1000});
}
