#pragma once

namespace XodrCodec
{
    // Codec version + implemented standard revision
    constexpr const char* Version = "0.1.0+1.7.0";

    constexpr unsigned StandardRevMajor = 1;
    constexpr unsigned StandardRevMinor = 7;
}
