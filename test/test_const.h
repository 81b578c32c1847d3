#pragma once

#define ExpectOrAssert(expr) EXPECT_TRUE(expr)
#define ExpectNearOrAssert(a, b, epsilon) EXPECT_NEAR(a, b, epsilon)
#define ExpectLTOrAssert(a, b) EXPECT_LT(a, b)

namespace XodrCodecTest
{
    const double epsilon = 1e-9;
    const double epsilon_integral_result = 1e-6;
}
