#include <gtest/gtest.h>
#include "callguard/decoration/auto_decoration_engine.hpp"
#include "callguard/decoration/capability_enumerator.hpp"
#include "callguard/resilience/fault_locator.hpp"
#include "common/recording_log_sink.hpp"
#include <stdexcept>

using namespace callguard;
using callguard_test::RecordingLogSink;

namespace
{

/**
 * @brief Service whose operations fail on demand.
 */
class PaymentGateway : public CapabilityHost
{
public:
    PaymentGateway()
    {
        expose("charge", &PaymentGateway::charge_impl);
        expose("refund", &PaymentGateway::refund_impl);
        expose("status", &PaymentGateway::status_impl);
        expose("_audit", &PaymentGateway::audit_impl);
        expose_property("attempts", &PaymentGateway::attempts);

        CapabilityOptions pinned;
        pinned.read_only = true;
        expose("version", &PaymentGateway::version_impl, pinned);
    }

    int charge(int cents)
    {
        return call<int(int)>("charge", cents);
    }

    void refund(int cents)
    {
        call<void(int)>("refund", cents);
    }

    std::string status()
    {
        return call<std::string()>("status");
    }

    void audit()
    {
        call<void()>("_audit");
    }

    int attempts() const
    {
        return m_attempts;
    }

    int failures_before_success{0};
    bool refund_fails{false};
    bool audit_fails{false};

private:
    int charge_impl(int cents)
    {
        ++m_attempts;
        if (failures_before_success > 0)
        {
            --failures_before_success;
            raise_traced<std::runtime_error>("gateway unreachable");
        }
        return cents;
    }

    void refund_impl(int)
    {
        if (refund_fails)
        {
            raise_traced<std::logic_error>("refund rejected");
        }
    }

    std::string status_impl()
    {
        throw std::invalid_argument("status unavailable");
    }

    void audit_impl()
    {
        if (audit_fails)
        {
            throw std::runtime_error("audit failed");
        }
    }

    std::string version_impl() const
    {
        return "1.0";
    }

    int m_attempts{0};
};

/**
 * @brief Host whose only operation outlasts short deadlines.
 */
class SlowCounter : public CapabilityHost
{
public:
    explicit SlowCounter(std::atomic<int>* completed)
        : m_completed{completed}
    {
        expose("work", &SlowCounter::work_impl);
    }

    int work()
    {
        return call<int()>("work");
    }

private:
    int work_impl()
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        ++m_counter;
        m_completed->store(m_counter);
        return m_counter;
    }

    int m_counter{0};
    std::atomic<int>* m_completed;
};

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class AutoDecorationEngineTests : public ::testing::Test
{
protected:
    DecorationPolicy base_policy()
    {
        DecorationPolicy policy;
        policy.sink = m_sink;
        policy.sleeper = [](std::chrono::nanoseconds) {};
        policy.retry_delay = std::chrono::milliseconds{1};
        return policy;
    }

    std::shared_ptr<RecordingLogSink> m_sink = std::make_shared<RecordingLogSink>();
    AutoDecorationEngine engine{m_sink};
    PaymentGateway gateway;
};

// =============================================================================
// Wrap
// =============================================================================

TEST_F(AutoDecorationEngineTests, Wrap_DecoratesPublicOperationsOnly)
{
    auto report = engine.wrap(gateway, base_policy());

    EXPECT_EQ(report.decorated, (std::vector<std::string>{"charge", "refund", "status"}));
    EXPECT_EQ(report.skipped, (std::vector<std::string>{"version"}));
    EXPECT_TRUE(report.replaced.empty());
    EXPECT_FALSE(gateway.capabilities().describe("_audit").decorated);
    EXPECT_FALSE(gateway.capabilities().describe("attempts").decorated);
    EXPECT_TRUE(m_sink->contains(LogLevel::Warn, "could not decorate capability 'version'"));
}

TEST_F(AutoDecorationEngineTests, Wrap_PrivateOperationStillRaises)
{
    engine.wrap(gateway, base_policy());
    gateway.audit_fails = true;
    EXPECT_THROW(gateway.audit(), std::runtime_error);
}

TEST_F(AutoDecorationEngineTests, Retry_RecoversTransientFault)
{
    auto policy = base_policy();
    policy.retry_attempts = 3;
    engine.wrap(gateway, policy);

    gateway.failures_before_success = 2;
    EXPECT_EQ(gateway.charge(500), 500);
    EXPECT_EQ(gateway.attempts(), 3);
}

TEST_F(AutoDecorationEngineTests, Retry_Exhausted_ReturnsTypedFallback)
{
    auto policy = base_policy();
    policy.retry_attempts = 2;
    policy.with_fallback<int>(-1);
    engine.wrap(gateway, policy);

    gateway.failures_before_success = 10;
    EXPECT_EQ(gateway.charge(500), -1);
    EXPECT_EQ(gateway.attempts(), 2);
    EXPECT_TRUE(m_sink->contains(LogLevel::Error, "call to 'charge' failed on all 2 attempts"));
}

TEST_F(AutoDecorationEngineTests, SingleShot_NoFallback_NonVoid_RethrowsAfterLogging)
{
    auto policy = base_policy();
    policy.log_level = LogLevel::Warn;
    policy.error_message = "payments";
    engine.wrap(gateway, policy);

    gateway.failures_before_success = 1;
    EXPECT_THROW(gateway.charge(100), std::runtime_error);
    EXPECT_TRUE(m_sink->contains(LogLevel::Warn, "payments: call to 'charge' failed"));
}

TEST_F(AutoDecorationEngineTests, SingleShot_VoidOperation_SwallowsFault)
{
    engine.wrap(gateway, base_policy());

    gateway.refund_fails = true;
    EXPECT_NO_THROW(gateway.refund(100));
    EXPECT_TRUE(m_sink->contains(LogLevel::Error, "call to 'refund' failed - std::logic_error: refund rejected"));
}

TEST_F(AutoDecorationEngineTests, UnmatchedFault_PropagatesWithKind)
{
    auto policy = base_policy();
    policy.matched_faults = FaultFilter::of<std::runtime_error>();
    policy.with_fallback<std::string>("unknown");
    engine.wrap(gateway, policy);

    EXPECT_THROW(gateway.status(), std::invalid_argument);
}

TEST_F(AutoDecorationEngineTests, MatchedFault_UsesStringFallback)
{
    auto policy = base_policy();
    policy.with_fallback<std::string>("unknown");
    engine.wrap(gateway, policy);

    EXPECT_EQ(gateway.status(), "unknown");
}

TEST_F(AutoDecorationEngineTests, Filter_SkipsRejectedNames)
{
    auto policy = base_policy();
    policy.filter = [](const std::string& name) { return name == "charge"; };
    auto report = engine.wrap(gateway, policy);

    EXPECT_EQ(report.decorated, (std::vector<std::string>{"charge"}));
    EXPECT_EQ(report.skipped, (std::vector<std::string>{"refund", "status", "version"}));
    EXPECT_FALSE(gateway.capabilities().describe("refund").decorated);
}

TEST_F(AutoDecorationEngineTests, Timeout_Layer_ReturnsFallback)
{
    auto policy = base_policy();
    policy.timeout = std::chrono::milliseconds{50};
    policy.with_fallback<int>(0);

    CapabilityTable table;
    table.declare<int()>("slow", [] {
        std::this_thread::sleep_for(std::chrono::milliseconds{400});
        return 1;
    });
    engine.wrap(table, policy);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(table.invoke<int()>("slow"), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{300});
    EXPECT_TRUE(m_sink->contains(LogLevel::Warn, "call to 'slow' timed out after 50ms"));
}

TEST_F(AutoDecorationEngineTests, Timeout_FallbackIgnoresFaultFilter)
{
    auto policy = base_policy();
    policy.timeout = std::chrono::milliseconds{30};
    policy.matched_faults = FaultFilter::of<std::runtime_error>();
    policy.with_fallback<int>(-1);

    CapabilityTable table;
    table.declare<int()>("slow", [] {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        return 1;
    });
    engine.wrap(table, policy);

    EXPECT_EQ(table.invoke<int()>("slow"), -1);
    EXPECT_EQ(table.abandoned_calls(), 1u);
    table.wait_for_abandoned_calls();
    EXPECT_EQ(table.abandoned_calls(), 0u);
}

TEST_F(AutoDecorationEngineTests, Timeout_NoFallbackForType_Throws)
{
    auto policy = base_policy();
    policy.timeout = std::chrono::milliseconds{30};
    policy.matched_faults = FaultFilter::of<std::runtime_error>();
    policy.with_fallback<std::string>("none");

    CapabilityTable table;
    table.declare<int()>("slow", [] {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        return 1;
    });
    engine.wrap(table, policy);

    try
    {
        table.invoke<int()>("slow");
        FAIL() << "expected CallGuardError";
    }
    catch (const CallGuardError& e)
    {
        EXPECT_EQ(e.code(), CallGuardErrorCode::TimeoutExceeded);
    }
    table.wait_for_abandoned_calls();
}

TEST_F(AutoDecorationEngineTests, Timeout_HostDestructionWaitsForAbandonedWorker)
{
    std::atomic<int> completed{0};
    auto host = std::make_unique<SlowCounter>(&completed);

    auto policy = base_policy();
    policy.timeout = std::chrono::milliseconds{20};
    policy.with_fallback<int>(-1);
    engine.wrap(*host, policy);

    EXPECT_EQ(host->work(), -1);
    EXPECT_EQ(completed.load(), 0);
    EXPECT_EQ(host->capabilities().abandoned_calls(), 1u);

    host.reset();
    EXPECT_EQ(completed.load(), 1);
}

TEST_F(AutoDecorationEngineTests, TimeCalls_LogsDuration)
{
    auto policy = base_policy();
    policy.time_calls = true;
    engine.wrap(gateway, policy);

    gateway.charge(1);
    EXPECT_TRUE(m_sink->contains(LogLevel::Info, "starting 'charge'"));
    EXPECT_TRUE(m_sink->contains(LogLevel::Info, "'charge' finished in"));
}

// =============================================================================
// Idempotence and Unwrap
// =============================================================================

TEST_F(AutoDecorationEngineTests, Rewrap_ReplacesInsteadOfNesting)
{
    auto policy = base_policy();
    policy.retry_attempts = 2;
    policy.with_fallback<int>(-1);

    engine.wrap(gateway, policy);
    auto report = engine.wrap(gateway, policy);

    EXPECT_EQ(report.replaced, (std::vector<std::string>{"charge", "refund", "status"}));
    EXPECT_TRUE(m_sink->contains(LogLevel::Debug, "capability 'charge' was already decorated"));

    gateway.failures_before_success = 10;
    EXPECT_EQ(gateway.charge(5), -1);
    EXPECT_EQ(gateway.attempts(), 2);
}

TEST_F(AutoDecorationEngineTests, Unwrap_RestoresOriginals)
{
    auto policy = base_policy();
    policy.with_fallback<int>(-1);
    engine.wrap(gateway, policy);

    EXPECT_EQ(engine.unwrap(gateway), 3u);
    for (const auto& desc : list_capabilities(gateway))
    {
        EXPECT_FALSE(desc.decorated) << desc.name;
    }

    gateway.failures_before_success = 1;
    EXPECT_THROW(gateway.charge(5), std::runtime_error);
}
