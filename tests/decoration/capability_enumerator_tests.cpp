#include <gtest/gtest.h>
#include "callguard/decoration/capability_enumerator.hpp"

using namespace callguard;

namespace
{

class Thermostat : public CapabilityHost
{
public:
    Thermostat()
    {
        expose("set_target", &Thermostat::set_target);
        expose("read", &Thermostat::read);
        expose("_calibrate", &Thermostat::calibrate);
        expose_property("target", &Thermostat::target);
    }

    void set_target(double value)
    {
        m_target = value;
    }

    double read() const
    {
        return m_target - 0.5;
    }

    double target() const
    {
        return m_target;
    }

    double via_table() const
    {
        return call<double()>("read");
    }

private:
    void calibrate()
    {
        m_target = 20.0;
    }

    double m_target{21.0};
};

} // namespace

TEST(CapabilityEnumeratorTests, IsPrivateName)
{
    EXPECT_TRUE(is_private_name("_hidden"));
    EXPECT_TRUE(is_private_name("__dunder__"));
    EXPECT_FALSE(is_private_name("visible"));
    EXPECT_FALSE(is_private_name("trailing_"));
    EXPECT_FALSE(is_private_name(""));
}

TEST(CapabilityEnumeratorTests, List_ExcludesPrivateAndProperties)
{
    Thermostat thermostat;
    auto listed = list_capabilities(thermostat);

    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].name, "read");
    EXPECT_EQ(listed[1].name, "set_target");
    for (const auto& desc : listed)
    {
        EXPECT_EQ(desc.kind, CapabilityKind::Operation);
        EXPECT_FALSE(desc.decorated);
    }

    // The table itself still knows about everything.
    EXPECT_EQ(thermostat.capabilities().size(), 4u);
}

TEST(CapabilityEnumeratorTests, List_IsStableAcrossCalls)
{
    Thermostat thermostat;
    auto first = list_capabilities(thermostat);
    auto second = list_capabilities(thermostat);

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_EQ(first[i].name, second[i].name);
        EXPECT_EQ(first[i].signature, second[i].signature);
    }
}

TEST(CapabilityEnumeratorTests, Descriptor_InvokesBoundMember)
{
    Thermostat thermostat;
    auto listed = list_capabilities(thermostat);

    listed[1].function<void(double)>()(18.0);
    EXPECT_DOUBLE_EQ(thermostat.target(), 18.0);
    EXPECT_DOUBLE_EQ(listed[0].function<double()>()(), 17.5);
    EXPECT_DOUBLE_EQ(thermostat.via_table(), 17.5);
}

TEST(CapabilityEnumeratorTests, EmptyTable_ListsNothing)
{
    CapabilityTable table;
    EXPECT_TRUE(list_capabilities(table).empty());
}
