#include <gtest/gtest.h>
#include <memory>

#include "../net/Identities.hpp"

using duel::core::error::RuleViolationCode;
using duel::net::IdentityTable;

namespace
{
    constexpr duel::core::ParticipantId Alice = 1001;
    constexpr duel::core::ParticipantId Bob = 2002;

    // Stands in for a live connection; the handle expires when it is reset
    auto connection() -> std::shared_ptr<int> { return std::make_shared<int>(0); }
}

TEST(Identities, Hello_Binds_Both_Directions)
{
    IdentityTable ids;
    auto const conn = connection();

    ASSERT_TRUE(ids.Bind(conn, Alice).has_value());
    EXPECT_EQ(ids.Lookup(conn), Alice);
    auto const route = ids.RouteTo(Alice);
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->lock(), conn);
    EXPECT_FALSE(ids.RouteTo(Bob).has_value());
}

TEST(Identities, Live_Identity_Cannot_Be_Claimed_By_Another_Connection)
{
    IdentityTable ids;
    auto const alice = connection();
    auto const intruder = connection();
    ASSERT_TRUE(ids.Bind(alice, Alice).has_value());

    auto const r = ids.Bind(intruder, Alice);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RuleViolationCode::Actor_IdentityTaken);

    EXPECT_FALSE(ids.Lookup(intruder).has_value());
    EXPECT_EQ(ids.RouteTo(Alice)->lock(), alice);

    // Repeating the Hello on the owning connection is harmless
    EXPECT_TRUE(ids.Bind(alice, Alice).has_value());
    EXPECT_EQ(ids.Size(), 1u);
}

TEST(Identities, Identity_Is_Free_Again_After_Close)
{
    IdentityTable ids;
    auto const first = connection();
    auto const second = connection();
    ASSERT_TRUE(ids.Bind(first, Alice).has_value());

    EXPECT_EQ(ids.Unbind(first), Alice);
    EXPECT_FALSE(ids.RouteTo(Alice).has_value());
    EXPECT_FALSE(ids.Unbind(first).has_value());

    ASSERT_TRUE(ids.Bind(second, Alice).has_value());
    EXPECT_EQ(ids.RouteTo(Alice)->lock(), second);
}

TEST(Identities, Expired_Route_Is_Replaced)
{
    IdentityTable ids;
    auto first = connection();
    auto const second = connection();
    ASSERT_TRUE(ids.Bind(first, Alice).has_value());

    first.reset();
    ASSERT_TRUE(ids.Bind(second, Alice).has_value());
    EXPECT_EQ(ids.RouteTo(Alice)->lock(), second);
    EXPECT_EQ(ids.Size(), 1u);
}

TEST(Identities, Rebinding_A_Connection_Drops_Its_Old_Route)
{
    IdentityTable ids;
    auto const conn = connection();
    ASSERT_TRUE(ids.Bind(conn, Alice).has_value());
    ASSERT_TRUE(ids.Bind(conn, Bob).has_value());

    EXPECT_EQ(ids.Lookup(conn), Bob);
    EXPECT_FALSE(ids.RouteTo(Alice).has_value());
    EXPECT_EQ(ids.RouteTo(Bob)->lock(), conn);
    EXPECT_EQ(ids.Size(), 1u);
}
