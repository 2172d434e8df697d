#include "callguard/common/log_sink.hpp"
#include "callguard/decoration/auto_decoration_engine.hpp"
#include "callguard/decoration/capability_enumerator.hpp"
#include "callguard/decoration/singleton_registry.hpp"
#include "callguard/decoration/synchronized.hpp"
#include "callguard/resilience/fault_locator.hpp"
#include "callguard/resilience/outcome.inline.hpp"
#include "callguard/resilience/retry_policy.hpp"
#include "callguard/resilience/timeout_guard.hpp"
#include <iostream>
#include <stdexcept>

namespace
{

using namespace callguard;

/**
 * @brief Toy service whose lookups fail on every other call.
 */
class InventoryService : public CapabilityHost
{
public:
    InventoryService()
    {
        expose("stock_level", &InventoryService::stock_level_impl);
        expose("reserve", &InventoryService::reserve_impl);
        expose("_reset", &InventoryService::reset_impl);
        expose_property("request_count", &InventoryService::request_count);
    }

    int stock_level(const std::string& sku)
    {
        return call<int(const std::string&)>("stock_level", sku);
    }

    void reserve(const std::string& sku, int quantity)
    {
        call<void(const std::string&, int)>("reserve", sku, quantity);
    }

    int request_count() const
    {
        return m_requests;
    }

private:
    int stock_level_impl(const std::string& sku)
    {
        if (++m_requests % 2 == 1)
        {
            raise_traced<std::runtime_error>("inventory backend unavailable");
        }
        return static_cast<int>(sku.size()) * 10;
    }

    void reserve_impl(const std::string& sku, int quantity)
    {
        if (quantity > stock_level_impl(sku))
        {
            raise_traced<std::out_of_range>("not enough stock for " + sku);
        }
    }

    void reset_impl()
    {
        m_requests = 0;
    }

    int m_requests{0};
};

void run_decorated_service()
{
    auto service = SingletonRegistry::global().instance<InventoryService>();

    std::cout << "capabilities:";
    for (const auto& desc : list_capabilities(*service))
    {
        std::cout << " " << desc.name;
    }
    std::cout << "\n";

    DecorationPolicy policy;
    policy.retry_attempts = 3;
    policy.retry_delay = std::chrono::milliseconds{10};
    policy.matched_faults = FaultFilter::of<std::runtime_error>();
    policy.time_calls = true;
    policy.with_fallback<int>(-1);

    AutoDecorationEngine engine;
    auto report = engine.wrap(*service, policy);
    std::cout << "decorated " << report.decorated.size() << " capabilities\n";

    std::cout << "stock_level(widget) = " << service->stock_level("widget") << "\n";
    auto reserve = synchronized([&service](const std::string& sku, int quantity) {
        service->reserve(sku, quantity);
    });
    reserve("widget", 5);
    std::cout << "requests so far: " << service->request_count() << "\n";

    engine.unwrap(*service);
}

void run_timeout()
{
    TimeoutConfig config;
    config.limit = std::chrono::milliseconds{100};
    TimeoutGuard<std::string> guard{config, std::string{"cached"}};

    auto slow = [] {
        std::this_thread::sleep_for(std::chrono::milliseconds{300});
        return std::string{"fresh"};
    };
    std::cout << "slow lookup returned '" << guard.run(slow) << "'\n";
}

void run_outcome()
{
    RetryConfig config;
    config.max_attempts = 2;
    config.initial_delay = std::chrono::milliseconds{5};
    RetryPolicy<double> retry{config, 0.0};

    auto outcome = execute([&retry] {
        return retry.run([] { return 42.0; });
    });
    outcome.put("source", std::string{"demo"});
    std::cout << outcome << ", value " << outcome.value_or(0.0) << "\n";

    auto failed = execute([] {
        raise_traced<std::logic_error>("demo failure");
    });
    std::cout << failed << "\n";
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== callguard ======\n" << std::flush;

        if (argc > 1)
        {
            auto level = callguard::parse_log_level(argv[1]);
            if (!level)
            {
                throw std::invalid_argument(std::string{"unknown log level: "} + argv[1]);
            }
            callguard::LoggingConfig logging;
            logging.min_level = *level;
            callguard::set_default_log_sink(std::make_shared<callguard::StreamLogSink>(std::clog, logging));
        }

        run_decorated_service();
        run_timeout();
        run_outcome();

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
