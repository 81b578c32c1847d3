#include <gtest/gtest.h>

#include "reader.h"
#include "writer.h"
#include "workarounds.h"
#include "errors.h"
#include "validation.h"
#include "test_const.h"
#include "xodr_samples.h"

namespace XodrCodecTest
{
    using namespace XodrCodec;

    TEST(Workaround, MissingPRangeIsRejectedByDefault)
    {
        const auto xml = SingleRoadDocument(StraightParamPoly3(""));
        try
        {
            Parse(xml);
            FAIL() << "paramPoly3 without pRange accepted";
        }
        catch (const ReadError& e)
        {
            EXPECT_EQ(e.Kind(), ErrorKind::MissingRequiredField);
            EXPECT_EQ(e.Field(), "pRange");
        }
    }

    TEST(Workaround, MissingPRangeReadsNormalized)
    {
        ReadOptions options;
        options.workarounds.Enable(Workaround::SumoIssue10301);
        auto doc = Parse(SingleRoadDocument(StraightParamPoly3("")), options);
        const auto& shape = std::get<ParamPoly3Shape>(doc.roads[0].planView[0].Shape());
        EXPECT_EQ(shape.pRange, ParamPoly3Range::Normalized);

        // Same document as one that states pRange explicitly
        EXPECT_EQ(doc, Parse(SingleRoadDocument(StraightParamPoly3(" pRange=\"normalized\""))));

        auto pose = doc.roads[0].Evaluate(Length(2.5));
        EXPECT_NEAR(pose.x.Value(), 2.5, epsilon_integral_result);

        // Written back with pRange, so strict readers accept it
        EXPECT_NO_THROW(Parse(Serialize(doc, options.workarounds)));
    }

    TEST(Workaround, RoadMarkColorAlwaysWritten)
    {
        auto doc = Parse(SingleRoadDocument(LineGeometry, LaneWithRoadMark("")));
        EXPECT_EQ(doc.roads[0].lanes.laneSections[0].right[0].roadMarks[0].color, RoadMarkColor::Standard);

        auto strict = Serialize(doc);
        EXPECT_EQ(strict.find("color="), std::string::npos);

        auto sumo = Serialize(doc, Workarounds().Enable(Workaround::SumoRoadMarkMissingColor));
        EXPECT_NE(sumo.find("color=\"standard\""), std::string::npos);

        EXPECT_EQ(Parse(sumo), doc);
        Validation::VerifyRoundTrip(doc, Workarounds::Sumo());
    }

    TEST(Workaround, SwitchesAreIndependent)
    {
        Workarounds w;
        EXPECT_EQ(w, Workarounds::Strict());
        w.Enable(Workaround::SumoIssue10301);
        EXPECT_TRUE(w.IsEnabled(Workaround::SumoIssue10301));
        EXPECT_FALSE(w.IsEnabled(Workaround::SumoRoadMarkMissingColor));

        // Color switch only affects writing
        ReadOptions options;
        options.workarounds.Enable(Workaround::SumoRoadMarkMissingColor);
        EXPECT_THROW(Parse(SingleRoadDocument(StraightParamPoly3("")), options), ReadError);

        w.Disable(Workaround::SumoIssue10301);
        EXPECT_EQ(w, Workarounds::Strict());
    }

    TEST(Workaround, EnableByName)
    {
        Workarounds w;
        w.EnableByName("workaround-sumo-roadmark-missing-color");
        EXPECT_TRUE(w.IsEnabled(Workaround::SumoRoadMarkMissingColor));
        EXPECT_FALSE(w.IsEnabled(Workaround::SumoIssue10301));

        EXPECT_EQ(Workarounds().EnableByName("workaround-sumo"), Workarounds::Sumo());
        EXPECT_THROW(w.EnableByName("workaround-unknown"), std::invalid_argument);

        auto names = Workarounds::Sumo().Names();
        ASSERT_EQ(names.size(), 2u);
        EXPECT_EQ(names[0], "workaround-sumo-issue-10301");
        EXPECT_EQ(names[1], "workaround-sumo-roadmark-missing-color");
        EXPECT_TRUE(Workarounds::Strict().Names().empty());
    }
}
