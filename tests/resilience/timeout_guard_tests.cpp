#include <gtest/gtest.h>
#include "callguard/common/callguard_errors.hpp"
#include "callguard/resilience/timeout_guard.hpp"
#include "common/recording_log_sink.hpp"
#include <atomic>
#include <stdexcept>

using namespace callguard;
using callguard_test::RecordingLogSink;
using std::chrono::milliseconds;

// =============================================================================
// Test Fixture
// =============================================================================

class TimeoutGuardTests : public ::testing::Test
{
protected:
    static TimeoutConfig limit(milliseconds value)
    {
        TimeoutConfig config;
        config.limit = value;
        return config;
    }

    static milliseconds since(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start);
    }

    std::shared_ptr<RecordingLogSink> m_sink = std::make_shared<RecordingLogSink>();
};

// =============================================================================
// Configuration
// =============================================================================

TEST_F(TimeoutGuardTests, NegativeLimit_Throws)
{
    try
    {
        TimeoutGuard<int> guard{limit(milliseconds{-5})};
        FAIL() << "expected CallGuardError";
    }
    catch (const CallGuardError& e)
    {
        EXPECT_EQ(e.code(), CallGuardErrorCode::InvalidPolicy);
    }
}

TEST_F(TimeoutGuardTests, PollSlice_IsClamped)
{
    TimeoutConfig config;
    config.poll_slice = milliseconds{5000};
    EXPECT_EQ(detail::effective_poll_slice(config), kMaxPollSlice);
    config.poll_slice = milliseconds{0};
    EXPECT_EQ(detail::effective_poll_slice(config), kMaxPollSlice);
    config.poll_slice = milliseconds{20};
    EXPECT_EQ(detail::effective_poll_slice(config), milliseconds{20});
}

// =============================================================================
// Within the Limit
// =============================================================================

TEST_F(TimeoutGuardTests, FastCall_ReturnsValue)
{
    TimeoutGuard<int> guard{limit(milliseconds{1000}), -1, m_sink};
    EXPECT_EQ(guard.run([](int a, int b) { return a * b; }, 6, 7), 42);
    EXPECT_EQ(m_sink->size(), 0u);
}

TEST_F(TimeoutGuardTests, WorkerFault_WithFallback_ReturnsFallbackAndLogs)
{
    TimeoutGuard<int> guard{limit(milliseconds{1000}), -1, m_sink};
    EXPECT_EQ(guard.run_labeled("parse", []() -> int { throw std::runtime_error("bad data"); }), -1);
    EXPECT_TRUE(m_sink->contains(LogLevel::Error, "worker for 'parse' failed: std::runtime_error: bad data"));
}

TEST_F(TimeoutGuardTests, WorkerFault_WithoutFallback_RethrowsOriginalKind)
{
    TimeoutGuard<int> guard{limit(milliseconds{1000}), std::nullopt, m_sink};
    EXPECT_THROW(guard.run([]() -> int { throw std::out_of_range("x"); }), std::out_of_range);
}

TEST_F(TimeoutGuardTests, Launch_Completed_ReportsValue)
{
    TimeoutGuard<std::string> guard{limit(milliseconds{1000}), std::nullopt, m_sink};
    auto result = guard.launch([] { return std::string{"done"}; });

    EXPECT_EQ(result.status, TimedStatus::Completed);
    EXPECT_FALSE(result.timed_out());
    ASSERT_TRUE(result.value.has_value());
    EXPECT_EQ(*result.value, "done");
    EXPECT_FALSE(result.orphan.valid());
}

TEST_F(TimeoutGuardTests, Launch_Faulted_ReportsFault)
{
    TimeoutGuard<int> guard{limit(milliseconds{1000}), std::nullopt, m_sink};
    auto result = guard.launch([]() -> int { throw std::runtime_error("x"); });

    EXPECT_EQ(result.status, TimedStatus::Faulted);
    EXPECT_NE(result.fault, nullptr);
    EXPECT_FALSE(result.value.has_value());
}

// =============================================================================
// Past the Limit
// =============================================================================

TEST_F(TimeoutGuardTests, SlowCall_ReturnsFallbackPromptly)
{
    TimeoutGuard<std::string> guard{limit(milliseconds{200}), std::string{"cached"}, m_sink};

    auto start = std::chrono::steady_clock::now();
    auto value = guard.run_labeled("fetch", [] {
        std::this_thread::sleep_for(milliseconds{1000});
        return std::string{"fresh"};
    });
    auto waited = since(start);

    EXPECT_EQ(value, "cached");
    EXPECT_GE(waited, milliseconds{190});
    EXPECT_LT(waited, milliseconds{600});
    EXPECT_TRUE(m_sink->contains(
        LogLevel::Warn, "call to 'fetch' timed out after 200ms; worker abandoned, returning fallback cached"));
}

TEST_F(TimeoutGuardTests, SlowCall_WithoutFallback_NonVoid_ThrowsTimeoutExceeded)
{
    TimeoutGuard<int> guard{limit(milliseconds{50}), std::nullopt, m_sink};
    try
    {
        guard.run([] {
            std::this_thread::sleep_for(milliseconds{500});
            return 1;
        });
        FAIL() << "expected CallGuardError";
    }
    catch (const CallGuardError& e)
    {
        EXPECT_EQ(e.code(), CallGuardErrorCode::TimeoutExceeded);
    }
}

TEST_F(TimeoutGuardTests, SlowCall_WithoutFallback_Void_Returns)
{
    TimeoutGuard<void> guard{limit(milliseconds{50}), std::nullopt, m_sink};
    EXPECT_NO_THROW(guard.run([] { std::this_thread::sleep_for(milliseconds{500}); }));
    EXPECT_EQ(m_sink->count(LogLevel::Warn), 1u);
}

TEST_F(TimeoutGuardTests, AbandonedWorker_KeepsRunning)
{
    auto finished = std::make_shared<std::atomic<bool>>(false);
    TimeoutGuard<int> guard{limit(milliseconds{50}), 0, m_sink};

    auto result = guard.launch([finished] {
        std::this_thread::sleep_for(milliseconds{200});
        finished->store(true);
        return 7;
    });

    ASSERT_TRUE(result.timed_out());
    ASSERT_TRUE(result.orphan.valid());
    EXPECT_FALSE(finished->load());

    ASSERT_TRUE(result.orphan.wait_for(milliseconds{5000}));
    EXPECT_TRUE(result.orphan.finished());
    EXPECT_TRUE(finished->load());
    EXPECT_EQ(result.orphan.take_value(), std::optional<int>{7});
    EXPECT_FALSE(result.orphan.take_value().has_value());
}

TEST_F(TimeoutGuardTests, AbandonedWorkerFault_LoggedAtDebugOnly)
{
    TimeoutGuard<int> guard{limit(milliseconds{30}), 0, m_sink};

    auto result = guard.launch_labeled("late", []() -> int {
        std::this_thread::sleep_for(milliseconds{150});
        throw std::runtime_error("too late");
    });

    ASSERT_TRUE(result.timed_out());
    result.orphan.wait();
    EXPECT_NE(result.orphan.fault(), nullptr);

    // The worker logs after publishing its result; give it a moment.
    for (int i = 0; i < 100 && m_sink->count(LogLevel::Debug) == 0; ++i)
    {
        std::this_thread::sleep_for(milliseconds{10});
    }
    EXPECT_TRUE(m_sink->contains(LogLevel::Debug, "abandoned worker for 'late'"));
    EXPECT_EQ(m_sink->count(LogLevel::Error), 0u);
}

TEST_F(TimeoutGuardTests, Collector_AdoptsOnlyAbandonedWorkers)
{
    auto abandoned = std::make_shared<AbandonedWorkers>();
    auto finished = std::make_shared<std::atomic<int>>(0);
    TimeoutGuard<int> guard{limit(milliseconds{40}), -1, m_sink, abandoned};

    EXPECT_EQ(guard.run([] { return 5; }), 5);
    EXPECT_EQ(abandoned->pending(), 0u);

    auto slow = [finished] {
        std::this_thread::sleep_for(milliseconds{300});
        return ++*finished;
    };
    EXPECT_EQ(guard.run(slow), -1);
    EXPECT_EQ(guard.run(slow), -1);
    EXPECT_EQ(abandoned->pending(), 2u);

    abandoned->wait_all();
    EXPECT_EQ(finished->load(), 2);
    EXPECT_EQ(abandoned->pending(), 0u);
}

TEST_F(TimeoutGuardTests, Wrap_ArgumentsAreCopiedIntoWorker)
{
    TimeoutGuard<std::size_t> guard{limit(milliseconds{1000}), std::nullopt, m_sink};
    auto length = guard.wrap([](const std::string& text) { return text.size(); }, "length");

    std::string input = "callguard";
    EXPECT_EQ(length(input), 9u);
}

TEST_F(TimeoutGuardTests, ConcurrentCalls_AreIndependent)
{
    TimeoutGuard<int> guard{limit(milliseconds{1000}), -1, m_sink};
    std::atomic<int> total{0};

    std::vector<std::thread> callers;
    for (int i = 1; i <= 4; ++i)
    {
        callers.emplace_back([&guard, &total, i] {
            total += guard.run([](int x) { return x * 10; }, i);
        });
    }
    for (auto& t : callers)
    {
        t.join();
    }
    EXPECT_EQ(total.load(), 100);
}
