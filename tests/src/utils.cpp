#include "unit-tests.hpp"

using namespace txgate;
using namespace txgate::tests;

TEST_F(UnitTest, Utils_ParseHexQuantity)
{
    EXPECT_EQ(utils::parseHexQuantity("0x0"), 0u);
    EXPECT_EQ(utils::parseHexQuantity("0x"), 0u);
    EXPECT_EQ(utils::parseHexQuantity("0x1A"), 26u);
    EXPECT_EQ(utils::parseHexQuantity("0xffffffffffffffff"), 0xffffffffffffffffull);
    EXPECT_EQ(utils::parseHexQuantity("42"), 42u);

    EXPECT_FALSE(utils::parseHexQuantity("").has_value());
    EXPECT_FALSE(utils::parseHexQuantity("0xzz").has_value());
    EXPECT_FALSE(utils::parseHexQuantity("0x10000000000000000").has_value());
    EXPECT_FALSE(utils::parseHexQuantity("12a").has_value());
}

TEST_F(UnitTest, Utils_HexPrefixHelpers)
{
    EXPECT_EQ(utils::withHexPrefix("abcd"), "0xabcd");
    EXPECT_EQ(utils::withHexPrefix("0xabcd"), "0xabcd");
    EXPECT_EQ(utils::withHexPrefix("0Xabcd"), "0Xabcd");
    EXPECT_EQ(utils::toLower("Nonce Too LOW"), "nonce too low");
}

TEST_F(UnitTest, Utils_UnixMillisConversion)
{
    const auto tp = utils::fromUnixMillis(1'700'000'000'123);
    EXPECT_EQ(utils::toUnixMillis(tp), 1'700'000'000'123);
}
