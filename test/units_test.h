#include <gtest/gtest.h>

#include "units.h"
#include "enums.h"
#include "test_const.h"

namespace XodrCodecTest
{
    using namespace XodrCodec;

    TEST(Units, ParsesDecimalLiterals)
    {
        double v = 0;
        EXPECT_EQ(ParseNumber("1.5", v), NumberFault::None);
        EXPECT_DOUBLE_EQ(v, 1.5);
        EXPECT_EQ(ParseNumber("-2", v), NumberFault::None);
        EXPECT_DOUBLE_EQ(v, -2);
        EXPECT_EQ(ParseNumber("+.25", v), NumberFault::None);
        EXPECT_DOUBLE_EQ(v, 0.25);
        EXPECT_EQ(ParseNumber("3.", v), NumberFault::None);
        EXPECT_DOUBLE_EQ(v, 3);
        EXPECT_EQ(ParseNumber("1e-05", v), NumberFault::None);
        EXPECT_DOUBLE_EQ(v, 1e-5);
        EXPECT_EQ(ParseNumber("6.02E+23", v), NumberFault::None);
        EXPECT_DOUBLE_EQ(v, 6.02e23);
        EXPECT_EQ(ParseNumber("  7.5\n", v), NumberFault::None);
        EXPECT_DOUBLE_EQ(v, 7.5);
    }

    TEST(Units, RejectsMalformedNumbers)
    {
        double v = 42;
        EXPECT_EQ(ParseNumber("", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("abc", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("1.5m", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("1e", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber(".", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("nan", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("inf", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("0x10", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("1 2", v), NumberFault::Malformed);
        EXPECT_EQ(ParseNumber("1e999", v), NumberFault::OutOfRange);
        EXPECT_EQ(v, 42);
    }

    TEST(Units, ParsesIntegers)
    {
        long long v = 0;
        EXPECT_EQ(ParseInteger("-3", v), NumberFault::None);
        EXPECT_EQ(v, -3);
        EXPECT_EQ(ParseInteger("+12", v), NumberFault::None);
        EXPECT_EQ(v, 12);
        EXPECT_EQ(ParseInteger("1.0", v), NumberFault::Malformed);
        EXPECT_EQ(ParseInteger("-", v), NumberFault::Malformed);
        EXPECT_EQ(ParseInteger("99999999999999999999999", v), NumberFault::OutOfRange);
    }

    TEST(Units, FormatsShortestRoundTrip)
    {
        EXPECT_EQ(FormatNumber(0.1), "0.1");
        EXPECT_EQ(FormatNumber(10), "10");
        EXPECT_EQ(FormatNumber(-3.5), "-3.5");

        for (double original : { 1.0 / 3, 2.0 / 3 * 1e-7, 123456.789, -9.87654321e12, 4.9e-324 })
        {
            double back = 0;
            ASSERT_EQ(ParseNumber(FormatNumber(original), back), NumberFault::None);
            EXPECT_EQ(back, original);
        }
    }

    TEST(Units, ConversionIsExplicit)
    {
        EXPECT_NEAR(DegreesToAngle(180).Value(), Pi, epsilon);
        EXPECT_NEAR(AngleToDegrees(Angle(Pi / 2)), 90, epsilon);
        EXPECT_NEAR(SpeedToMetersPerSecond(36, SpeedUnit::KilometersPerHour), 10, epsilon);
        EXPECT_NEAR(SpeedToMetersPerSecond(1, SpeedUnit::MilesPerHour), 0.44704, epsilon);
        EXPECT_NEAR(SpeedToMetersPerSecond(5, SpeedUnit::MetersPerSecond), 5, epsilon);
    }

    TEST(Units, QuantityArithmetic)
    {
        Length a(3), b(4.5);
        EXPECT_EQ((a + b).Value(), 7.5);
        EXPECT_EQ((b - a).Value(), 1.5);
        EXPECT_EQ((a * 2).Value(), 6);
        EXPECT_EQ((-a).Value(), -3);
        EXPECT_TRUE(a < b);
        a += b;
        EXPECT_EQ(a, Length(7.5));
    }

    TEST(Enums, TokensAreCaseSensitive)
    {
        LaneType type = LaneType::None;
        EXPECT_TRUE(EnumFromString("driving", type));
        EXPECT_EQ(type, LaneType::Driving);
        EXPECT_FALSE(EnumFromString("Driving", type));
        EXPECT_TRUE(EnumFromString("HOV", type));
        EXPECT_EQ(type, LaneType::HOV);

        RoadMarkType markType = RoadMarkType::None;
        EXPECT_TRUE(EnumFromString("botts dots", markType));
        EXPECT_EQ(markType, RoadMarkType::BottsDots);
        EXPECT_STREQ(EnumToString(RoadMarkType::SolidBroken), "solid broken");
        EXPECT_STREQ(EnumTypeName<LaneType>(), "e_laneType");
    }

    TEST(Enums, EveryValueHasAToken)
    {
        for (auto value : EnumValues<ObjectType>())
        {
            ObjectType back = ObjectType::None;
            ASSERT_TRUE(EnumFromString(EnumToString(value), back));
            EXPECT_EQ(back, value);
        }
        EXPECT_EQ(EnumValues<LaneType>().size(), 26u);
        EXPECT_EQ(EnumValues<SpeedUnit>().size(), 3u);
    }
}
