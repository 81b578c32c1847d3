#include <gtest/gtest.h>

#include "reader.h"
#include "writer.h"
#include "document.h"
#include "validation.h"
#include "test_const.h"

namespace XodrCodecTest
{
    using namespace XodrCodec;

    const std::string SampleNetwork = std::string(XODRCODEC_TEST_DATA_DIR) + "/sample_network.xodr";

    TEST(Document, SampleNetwork)
    {
        std::vector<Diagnostic> diagnostics;
        ReadOptions options;
        options.diagnostics = &diagnostics;
        auto doc = ParseFile(SampleNetwork, options);
        EXPECT_TRUE(diagnostics.empty());

        EXPECT_EQ(doc.header.vendor, std::optional<std::string>("xodrcodec"));
        ASSERT_TRUE(doc.header.geoReference.has_value());
        EXPECT_EQ(doc.header.geoReference->projection, "+proj=tmerc +lat_0=48.1 +lon_0=11.5 +ellps=WGS84");

        ASSERT_EQ(doc.roads.size(), 3u);
        ASSERT_EQ(doc.controllers.size(), 1u);
        ASSERT_EQ(doc.junctions.size(), 1u);

        const auto* approach = doc.FindRoad("1");
        ASSERT_NE(approach, nullptr);
        EXPECT_EQ(approach->name, std::optional<std::string>("Approach"));
        ASSERT_TRUE(approach->objects.has_value());
        EXPECT_EQ(approach->objects->objects.at(0).dynamic, std::optional<bool>(false));
        ASSERT_TRUE(approach->signals.has_value());
        EXPECT_TRUE(approach->signals->signals.at(0).dynamic);
        EXPECT_EQ(approach->lanes.laneSections[0].right.size(), 2u);
        EXPECT_TRUE(approach->lanes.laneSections[0].right[1].level);

        const auto* turn = doc.FindRoad("2");
        ASSERT_NE(turn, nullptr);
        EXPECT_TRUE(turn->InJunction());
        // Quarter circle of radius 10
        auto end = turn->Evaluate(turn->length);
        EXPECT_NEAR(end.x.Value(), 110, epsilon_integral_result);
        EXPECT_NEAR(end.y.Value(), 10, epsilon_integral_result);
        EXPECT_NEAR(end.hdg.Value(), Pi / 2, epsilon_integral_result);

        const auto* exitRoad = doc.FindRoad("3");
        ASSERT_NE(exitRoad, nullptr);
        EXPECT_EQ(exitRoad->lanes.laneSections.size(), 2u);
        EXPECT_TRUE(std::holds_alternative<LaneBorder>(exitRoad->lanes.laneSections[1].right[1].shape[0]));
        ASSERT_EQ(exitRoad->extra.userData.size(), 1u);
        EXPECT_EQ(exitRoad->extra.userData[0].content.at(0).text, "mobile mapping");

        EXPECT_EQ(doc.FindRoad("4"), nullptr);
        EXPECT_NE(doc.FindJunction("j1"), nullptr);
        EXPECT_NE(doc.FindController("c1"), nullptr);
        EXPECT_EQ(doc.FindController("c2"), nullptr);

        EXPECT_TRUE(doc.FindDanglingReferences().empty());
        Validation::VerifyRoundTrip(doc);
    }

    TEST(Document, FindIsMutable)
    {
        auto doc = ParseFile(SampleNetwork);
        doc.FindRoad("2")->name = "Renamed";
        EXPECT_EQ(doc.roads[1].name, std::optional<std::string>("Renamed"));
    }

    TEST(Document, DanglingReferences)
    {
        auto doc = ParseFile(SampleNetwork);
        // The reader accepts unresolved ids; only the network check reports them
        doc.roads[1].link->successor->elementId = "99";
        doc.controllers[0].controls[0].signalId = "s9";
        doc.junctions[0].connections[0].connectingRoad = "98";

        auto dangling = doc.FindDanglingReferences();
        ASSERT_EQ(dangling.size(), 3u);
        EXPECT_EQ(dangling[0], (DanglingReference{ "OpenDRIVE.road[1].link.successor", "elementId", "99" }));
        EXPECT_EQ(dangling[1], (DanglingReference{ "OpenDRIVE.controller[0].control[0]", "signalId", "s9" }));
        EXPECT_EQ(dangling[2], (DanglingReference{ "OpenDRIVE.junction[0].connection[0]", "connectingRoad", "98" }));

        EXPECT_NO_THROW(Parse(Serialize(doc)));
    }

    TEST(Document, RailAndGroupReferences)
    {
        auto doc = ParseFile(SampleNetwork);
        Railroad railroad;
        railroad.switches.push_back(RailroadSwitch{ "W1", "sw1", SwitchPosition::Dynamic,
            SwitchTrack{ doc.roads[0].id, Length(0), ElementDir::Plus }, SwitchTrack{ "r9", Length(0), ElementDir::Minus },
            std::nullopt, {} });
        doc.roads[0].railroad = railroad;
        doc.junctionGroups.push_back(JunctionGroup{ "g1", std::nullopt, JunctionGroupType::Roundabout,
            { doc.junctions[0].id, "j8" }, {} });
        doc.stations.push_back(Station{ "st1", "Central", std::nullopt,
            { Platform{ "p1", std::nullopt, { PlatformSegment{ "r7", Length(0), Length(5), SegmentSide::Right } }, {} } }, {} });

        auto dangling = doc.FindDanglingReferences();
        ASSERT_EQ(dangling.size(), 3u);
        EXPECT_EQ(dangling[0], (DanglingReference{ "OpenDRIVE.road[0].railroad.switch[0].sideTrack", "id", "r9" }));
        EXPECT_EQ(dangling[1], (DanglingReference{ "OpenDRIVE.junctionGroup[0].junctionReference[1]", "junction", "j8" }));
        EXPECT_EQ(dangling[2], (DanglingReference{ "OpenDRIVE.station[0].platform[0].segment[0]", "roadId", "r7" }));
        Validation::VerifyRoundTrip(doc);
    }

    TEST(Document, JunctionReferenceOfRoad)
    {
        auto doc = ParseFile(SampleNetwork);
        doc.roads[1].junction = "j7";
        auto dangling = doc.FindDanglingReferences();
        ASSERT_EQ(dangling.size(), 1u);
        EXPECT_EQ(dangling[0].field, "junction");
        EXPECT_EQ(dangling[0].id, "j7");
    }
}
