#include <gtest/gtest.h>
#include "callguard/resilience/exception_handler.hpp"
#include "common/recording_log_sink.hpp"
#include <stdexcept>

using namespace callguard;
using callguard_test::RecordingLogSink;

class ExceptionHandlerTests : public ::testing::Test
{
protected:
    std::shared_ptr<RecordingLogSink> m_sink = std::make_shared<RecordingLogSink>();
};

// =============================================================================
// Matched Faults
// =============================================================================

TEST_F(ExceptionHandlerTests, Success_ReturnsValueWithoutLogging)
{
    ExceptionHandler<int> handler{{}, 0, m_sink};
    EXPECT_EQ(handler.run([](int x) { return x * 2; }, 21), 42);
    EXPECT_EQ(m_sink->size(), 0u);
}

TEST_F(ExceptionHandlerTests, MatchedFault_ReturnsFallbackAndLogs)
{
    ExceptionHandlerConfig config;
    config.error_message = "lookup";
    config.log_level = LogLevel::Warn;
    ExceptionHandler<int> handler{config, -1, m_sink};

    auto find = []() -> int { throw std::runtime_error("gone"); };
    int result = handler.run_labeled("find", find);

    EXPECT_EQ(result, -1);
    ASSERT_EQ(m_sink->size(), 1u);
    auto record = m_sink->records().front();
    EXPECT_EQ(record.level, LogLevel::Warn);
    EXPECT_EQ(record.message,
              "lookup: call to 'find' failed - std::runtime_error: gone, returning fallback -1");
}

TEST_F(ExceptionHandlerTests, SettleReportsFallbackOrigin)
{
    ExceptionHandler<int> handler{{}, 7, m_sink};
    auto fn = []() -> int { throw std::runtime_error("x"); };
    auto settlement = handler.settle("fn", fn);

    auto* recovered = std::get_if<Recovered<int>>(&settlement);
    ASSERT_NE(recovered, nullptr);
    EXPECT_EQ(recovered->value, 7);
    EXPECT_TRUE(recovered->from_fallback);
}

TEST_F(ExceptionHandlerTests, NoFallback_NonVoid_Rethrows)
{
    ExceptionHandler<int> handler{{}, std::nullopt, m_sink};
    EXPECT_THROW(handler.run([]() -> int { throw std::runtime_error("x"); }), std::runtime_error);
    EXPECT_EQ(m_sink->count(LogLevel::Error), 1u);
}

TEST_F(ExceptionHandlerTests, NoFallback_Void_Swallows)
{
    ExceptionHandler<void> handler{{}, std::nullopt, m_sink};
    EXPECT_NO_THROW(handler.run([] { throw std::runtime_error("x"); }));
    EXPECT_EQ(m_sink->count(LogLevel::Error), 1u);
}

TEST_F(ExceptionHandlerTests, Reraise_LogsThenRethrows)
{
    ExceptionHandlerConfig config;
    config.reraise = true;
    ExceptionHandler<int> handler{config, 5, m_sink};

    EXPECT_THROW(handler.run([]() -> int { throw std::logic_error("x"); }), std::logic_error);
    EXPECT_TRUE(m_sink->contains(LogLevel::Error, ", rethrowing"));
}

// =============================================================================
// Unmatched Faults
// =============================================================================

TEST_F(ExceptionHandlerTests, UnmatchedFault_PropagatesUnchangedAndUnlogged)
{
    ExceptionHandlerConfig config;
    config.matched_faults = FaultFilter::of<std::runtime_error>();
    ExceptionHandler<int> handler{config, 0, m_sink};

    EXPECT_THROW(handler.run([]() -> int { throw std::invalid_argument("x"); }), std::invalid_argument);
    EXPECT_EQ(m_sink->size(), 0u);
}

TEST_F(ExceptionHandlerTests, FilterMatchesDerivedTypes)
{
    ExceptionHandlerConfig config;
    config.matched_faults = FaultFilter::of<std::runtime_error>();
    ExceptionHandler<int> handler{config, 3, m_sink};

    EXPECT_EQ(handler.run([]() -> int { throw std::range_error("x"); }), 3);
}

// =============================================================================
// Wrap
// =============================================================================

TEST_F(ExceptionHandlerTests, Wrap_ProducesReusableCallable)
{
    ExceptionHandler<int> handler{{}, 0, m_sink};
    auto safe_div = handler.wrap([](int a, int b) -> int {
        if (b == 0)
        {
            throw std::domain_error("division by zero");
        }
        return a / b;
    }, "div");

    EXPECT_EQ(safe_div(10, 2), 5);
    EXPECT_EQ(safe_div(1, 0), 0);
    EXPECT_TRUE(m_sink->contains(LogLevel::Error, "call to 'div' failed - std::domain_error"));
}

// =============================================================================
// Fault Filter
// =============================================================================

TEST(FaultFilterTests, Empty_MatchesEverythingButNull)
{
    FaultFilter filter;
    EXPECT_TRUE(filter.matches_all());
    EXPECT_TRUE(filter.matches(std::make_exception_ptr(42)));
    EXPECT_FALSE(filter.matches(std::exception_ptr{}));
    EXPECT_EQ(filter.describe(), "any");
}

TEST(FaultFilterTests, Of_ListsKinds)
{
    auto filter = FaultFilter::of<std::runtime_error, std::logic_error>();
    EXPECT_FALSE(filter.matches_all());
    EXPECT_TRUE(filter.matches(std::make_exception_ptr(std::invalid_argument("x"))));
    EXPECT_FALSE(filter.matches(std::make_exception_ptr(std::bad_alloc())));
    EXPECT_EQ(filter.describe(), "std::runtime_error, std::logic_error");
}
