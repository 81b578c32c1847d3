#pragma once

#include <string>

namespace XodrCodec
{
    struct Document;
    struct Road;
    class Workarounds;
}

namespace XodrCodecTest
{
    class Validation
    {
    public:
        // Parse(Serialize(doc)) == doc, and serializing the result reproduces the same bytes
        static void VerifyRoundTrip(const XodrCodec::Document& doc, const XodrCodec::Workarounds& workarounds);

        static void VerifyRoundTrip(const XodrCodec::Document& doc);

        static void VerifySingleRoad(const XodrCodec::Road& road);

        static bool CompareFiles(const std::string& p1, const std::string& p2);

    private:
        static void VerifyPlanViewContinuity(const XodrCodec::Road& road);

        static void VerifyLaneSections(const XodrCodec::Road& road);
    };
}
