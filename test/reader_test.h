#include <gtest/gtest.h>

#include "reader.h"
#include "errors.h"
#include "test_const.h"
#include "xodr_samples.h"

namespace XodrCodecTest
{
    using namespace XodrCodec;

    ReadError ExpectReadError(const std::string& xml, ErrorKind kind, const ReadOptions& options = {})
    {
        try
        {
            Parse(xml, options);
        }
        catch (const ReadError& e)
        {
            EXPECT_EQ(e.Kind(), kind) << e.what();
            return e;
        }
        ADD_FAILURE() << "Expected ReadError " << ToString(kind);
        return ReadError(kind, "", "", "", 0, "not thrown");
    }

    TEST(Reader, MinimalDocument)
    {
        auto doc = Parse(SingleRoadDocument());
        EXPECT_EQ(doc.header.revMajor, 1u);
        EXPECT_EQ(doc.header.revMinor, 7u);
        ASSERT_TRUE(doc.header.name.has_value());
        EXPECT_EQ(*doc.header.name, "sample");

        ASSERT_EQ(doc.roads.size(), 1u);
        const auto& road = doc.roads.front();
        EXPECT_EQ(road.id, "1");
        EXPECT_EQ(road.length, Length(10));
        EXPECT_FALSE(road.InJunction());
        EXPECT_EQ(road.rule, TrafficRule::RHT);
        ASSERT_EQ(road.planView.size(), 1u);
        EXPECT_TRUE(std::holds_alternative<LineShape>(road.planView[0].Shape()));

        ASSERT_EQ(road.lanes.laneSections.size(), 1u);
        const auto& section = road.lanes.laneSections[0];
        EXPECT_TRUE(section.left.empty());
        EXPECT_EQ(section.center.id, 0);
        EXPECT_EQ(section.center.type, LaneType::None);
        ASSERT_EQ(section.right.size(), 1u);
        EXPECT_EQ(section.right[0].id, -1);
        ASSERT_EQ(section.right[0].shape.size(), 1u);
        EXPECT_EQ(std::get<LaneWidth>(section.right[0].shape[0]).a, 3.5);
    }

    // Road with a single line of length 10 from the origin
    TEST(Reader, EvaluateParsedRoad)
    {
        auto doc = Parse(SingleRoadDocument());
        auto pose = doc.roads.front().Evaluate(Length(5));
        EXPECT_NEAR(pose.x.Value(), 5, epsilon);
        EXPECT_NEAR(pose.y.Value(), 0, epsilon);
        EXPECT_NEAR(pose.hdg.Value(), 0, epsilon);
    }

    TEST(Reader, EveryShapeElement)
    {
        const std::string planView =
            "<geometry s=\"0\" x=\"0\" y=\"0\" hdg=\"0\" length=\"10\"><line/></geometry>"
            "<geometry s=\"10\" x=\"10\" y=\"0\" hdg=\"0\" length=\"10\"><spiral curvStart=\"0\" curvEnd=\"0.01\"/></geometry>"
            "<geometry s=\"20\" x=\"20\" y=\"0.2\" hdg=\"0.05\" length=\"10\"><arc curvature=\"0.01\"/></geometry>"
            "<geometry s=\"30\" x=\"30\" y=\"1\" hdg=\"0.15\" length=\"10\"><poly3 a=\"0\" b=\"0\" c=\"0.001\" d=\"0\"/></geometry>"
            "<geometry s=\"40\" x=\"40\" y=\"2\" hdg=\"0.2\" length=\"10\">"
            "<paramPoly3 aU=\"0\" bU=\"10\" cU=\"0\" dU=\"0\" aV=\"0\" bV=\"0\" cV=\"1\" dV=\"0\" pRange=\"normalized\"/></geometry>";
        auto doc = Parse(SingleRoadDocument(planView, DefaultLaneSection, "50"));
        const auto& pv = doc.roads.front().planView;
        ASSERT_EQ(pv.size(), 5u);
        EXPECT_EQ(std::get<SpiralShape>(pv[1].Shape()).curvEnd, Curvature(0.01));
        EXPECT_EQ(std::get<ArcShape>(pv[2].Shape()).curvature, Curvature(0.01));
        EXPECT_EQ(std::get<Poly3Shape>(pv[3].Shape()).c, 0.001);
        const auto& param = std::get<ParamPoly3Shape>(pv[4].Shape());
        EXPECT_EQ(param.bU, 10);
        EXPECT_EQ(param.cV, 1);
        EXPECT_EQ(param.pRange, ParamPoly3Range::Normalized);
    }

    TEST(Reader, OptionalFeatures)
    {
        const std::string children =
            "<link><predecessor elementType=\"junction\" elementId=\"7\"/>"
            "<successor elementType=\"road\" elementId=\"2\" contactPoint=\"start\"/></link>"
            "<type s=\"0\" type=\"town\" country=\"DE\"><speed max=\"50\" unit=\"km/h\"/></type>"
            "<type s=\"5\" type=\"motorway\"><speed max=\"no limit\"/></type>";
        auto xml = DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", " name=\"Main\" rule=\"LHT\"", children));
        auto doc = Parse(xml);
        const auto& road = doc.roads.front();
        ASSERT_TRUE(road.name.has_value());
        EXPECT_EQ(*road.name, "Main");
        EXPECT_EQ(road.rule, TrafficRule::LHT);

        ASSERT_TRUE(road.link.has_value());
        ASSERT_TRUE(road.link->predecessor.has_value());
        EXPECT_EQ(road.link->predecessor->elementType, ElementType::Junction);
        EXPECT_EQ(road.link->predecessor->elementId, "7");
        EXPECT_FALSE(road.link->predecessor->contactPoint.has_value());
        EXPECT_EQ(road.link->successor->contactPoint, ContactPoint::Start);

        ASSERT_EQ(road.types.size(), 2u);
        EXPECT_EQ(road.types[0].type, RoadType::Town);
        ASSERT_TRUE(road.types[0].speed.has_value());
        EXPECT_EQ(road.types[0].speed->max, MaxSpeed::Limit(50));
        EXPECT_EQ(road.types[0].speed->unit, SpeedUnit::KilometersPerHour);
        EXPECT_EQ(road.types[1].speed->max.kind, SpeedLimitKind::NoLimit);
        EXPECT_EQ(road.types[1].speed->unit, SpeedUnit::MetersPerSecond);
    }

    TEST(Reader, RoadMarkDefaults)
    {
        auto doc = Parse(SingleRoadDocument(LineGeometry, LaneWithRoadMark("")));
        const auto& mark = doc.roads.front().lanes.laneSections[0].right[0].roadMarks.at(0);
        EXPECT_EQ(mark.type, RoadMarkType::Solid);
        EXPECT_EQ(mark.color, RoadMarkColor::Standard);
        EXPECT_EQ(mark.laneChange, LaneChange::Both);
        EXPECT_FALSE(mark.weight.has_value());

        auto colored = Parse(SingleRoadDocument(LineGeometry, LaneWithRoadMark(" color=\"yellow\" laneChange=\"none\"")));
        const auto& mark2 = colored.roads.front().lanes.laneSections[0].right[0].roadMarks.at(0);
        EXPECT_EQ(mark2.color, RoadMarkColor::Yellow);
        EXPECT_EQ(mark2.laneChange, LaneChange::None);
    }

    TEST(Reader, JunctionAndController)
    {
        const std::string body = RoadXml() +
            "<controller id=\"c1\" name=\"ctl\"><control signalId=\"s1\" type=\"0\"/></controller>"
            "<junction id=\"j1\" name=\"cross\">"
            "<connection id=\"0\" incomingRoad=\"1\" connectingRoad=\"2\" contactPoint=\"start\">"
            "<laneLink from=\"-1\" to=\"-1\"/></connection>"
            "<priority high=\"1\" low=\"3\"/>"
            "<controller id=\"c1\" sequence=\"2\"/>"
            "</junction>";
        auto doc = Parse(DocumentXml(body));
        ASSERT_EQ(doc.controllers.size(), 1u);
        EXPECT_EQ(doc.controllers[0].controls.at(0).signalId, "s1");

        ASSERT_EQ(doc.junctions.size(), 1u);
        const auto& junction = doc.junctions[0];
        EXPECT_EQ(junction.type, JunctionType::Default);
        ASSERT_EQ(junction.connections.size(), 1u);
        EXPECT_EQ(junction.connections[0].incomingRoad, std::optional<std::string>("1"));
        EXPECT_EQ(junction.connections[0].contactPoint, ContactPoint::Start);
        ASSERT_EQ(junction.connections[0].laneLinks.size(), 1u);
        EXPECT_EQ(junction.connections[0].laneLinks[0].from, -1);
        ASSERT_EQ(junction.priorities.size(), 1u);
        ASSERT_EQ(junction.controllers.size(), 1u);
        EXPECT_EQ(junction.controllers[0].sequence, std::optional<unsigned>(2));
    }

    TEST(Reader, ObjectGeometryAndMarkings)
    {
        const std::string children =
            "<objects><object id=\"o1\" s=\"2\" t=\"-3\" zOffset=\"0\" type=\"parkingSpace\">"
            "<outlines><outline id=\"0\" fillType=\"asphalt\" outer=\"true\" closed=\"true\">"
            "<cornerRoad s=\"2\" t=\"-3\" dz=\"0\" height=\"0\" id=\"0\"/>"
            "<cornerLocal u=\"5\" v=\"0\" z=\"0\" height=\"0\" id=\"1\"/>"
            "<cornerRoad s=\"7\" t=\"-5\" dz=\"0\" height=\"0\" id=\"2\"/>"
            "</outline></outlines>"
            "<material surface=\"asphalt\" friction=\"0.8\"/>"
            "<parkingSpace access=\"handicapped\" restrictions=\"2h\"/>"
            "<markings><marking side=\"front\" color=\"white\" spaceLength=\"0\" lineLength=\"1\" "
            "startOffset=\"0\" stopOffset=\"0\"><cornerReference id=\"0\"/><cornerReference id=\"1\"/></marking></markings>"
            "<borders><border width=\"0.2\" type=\"curb\" outlineId=\"0\" useCompleteOutline=\"true\"/></borders>"
            "<surface><CRG file=\"lot.crg\" hideRoadSurfaceCRG=\"true\" zScale=\"1\"/></surface>"
            "</object></objects>";
        auto doc = Parse(DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", "", children)));
        const auto& object = doc.roads.front().objects->objects.at(0);
        EXPECT_FALSE(object.outline.has_value());
        ASSERT_TRUE(object.outlines.has_value());
        const auto& outline = object.outlines->outlines.at(0);
        EXPECT_EQ(outline.fillType, OutlineFillType::Asphalt);
        EXPECT_EQ(outline.closed, std::optional<bool>(true));
        ASSERT_EQ(outline.corners.size(), 3u);
        EXPECT_TRUE(std::holds_alternative<CornerRoad>(outline.corners[0]));
        EXPECT_EQ(std::get<CornerLocal>(outline.corners[1]).u, Length(5));
        EXPECT_EQ(std::get<CornerRoad>(outline.corners[2]).id, std::optional<unsigned>(2));

        ASSERT_EQ(object.materials.size(), 1u);
        EXPECT_EQ(object.materials[0].surface, std::optional<std::string>("asphalt"));
        EXPECT_FALSE(object.materials[0].roughness.has_value());
        ASSERT_TRUE(object.parkingSpace.has_value());
        EXPECT_EQ(object.parkingSpace->access, ParkingAccess::Handicapped);

        ASSERT_TRUE(object.markings.has_value());
        const auto& marking = object.markings->markings.at(0);
        EXPECT_EQ(marking.side, MarkingSide::Front);
        EXPECT_EQ(marking.color, RoadMarkColor::White);
        EXPECT_EQ(marking.cornerReferences, (std::vector<unsigned>{ 0, 1 }));

        ASSERT_TRUE(object.borders.has_value());
        EXPECT_EQ(object.borders->borders.at(0).type, ObjectBorderType::Curb);
        EXPECT_EQ(object.borders->borders.at(0).width, Length(0.2));

        ASSERT_TRUE(object.surface.has_value() && object.surface->crg.has_value());
        EXPECT_EQ(object.surface->crg->file, std::optional<std::string>("lot.crg"));
    }

    TEST(Reader, RoadSurfaceAndRailroad)
    {
        const std::string children =
            "<surface><CRG file=\"road.crg\" sStart=\"0\" sEnd=\"8\" orientation=\"opposite\" mode=\"genuine\" "
            "purpose=\"elevation\" hOffset=\"0.1\"/></surface>"
            "<railroad><switch name=\"W1\" id=\"sw1\" position=\"straight\">"
            "<mainTrack id=\"1\" s=\"4\" dir=\"+\"/><sideTrack id=\"2\" s=\"0\" dir=\"-\"/>"
            "<partner id=\"sw2\"/></switch></railroad>";
        auto doc = Parse(DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", "", children)));
        const auto& road = doc.roads.front();
        ASSERT_TRUE(road.surface.has_value());
        ASSERT_EQ(road.surface->crgs.size(), 1u);
        const auto& crg = road.surface->crgs[0];
        EXPECT_EQ(crg.sEnd, Length(8));
        EXPECT_EQ(crg.orientation, CrgOrientation::Opposite);
        EXPECT_EQ(crg.mode, RoadCrgMode::Genuine);
        EXPECT_EQ(crg.purpose, CrgPurpose::Elevation);
        EXPECT_FALSE(crg.zScale.has_value());

        ASSERT_TRUE(road.railroad.has_value());
        const auto& railSwitch = road.railroad->switches.at(0);
        EXPECT_EQ(railSwitch.position, SwitchPosition::Straight);
        EXPECT_EQ(railSwitch.mainTrack.id, "1");
        EXPECT_EQ(railSwitch.sideTrack.dir, ElementDir::Minus);
        ASSERT_TRUE(railSwitch.partner.has_value());
        EXPECT_EQ(railSwitch.partner->id, "sw2");
        EXPECT_FALSE(railSwitch.partner->name.has_value());
    }

    TEST(Reader, JunctionGroupAndStation)
    {
        const std::string body = RoadXml() +
            "<junction id=\"j1\"><connection id=\"0\" incomingRoad=\"1\"/>"
            "<surface><CRG file=\"j.crg\" mode=\"global\" zScale=\"2\"/></surface></junction>"
            "<junctionGroup id=\"g1\" name=\"ring\" type=\"roundabout\"><junctionReference junction=\"j1\"/></junctionGroup>"
            "<station id=\"st1\" name=\"Central\" type=\"large\"><platform id=\"p1\">"
            "<segment roadId=\"1\" sStart=\"0\" sEnd=\"10\" side=\"left\"/></platform></station>";
        auto doc = Parse(DocumentXml(body));
        ASSERT_TRUE(doc.junctions.at(0).surface.has_value());
        EXPECT_EQ(doc.junctions[0].surface->crgs.at(0).zScale, std::optional<double>(2));

        ASSERT_EQ(doc.junctionGroups.size(), 1u);
        EXPECT_EQ(doc.junctionGroups[0].type, JunctionGroupType::Roundabout);
        EXPECT_EQ(doc.junctionGroups[0].junctionReferences, std::vector<std::string>{ "j1" });

        ASSERT_EQ(doc.stations.size(), 1u);
        EXPECT_EQ(doc.stations[0].type, StationType::Large);
        const auto& segment = doc.stations[0].platforms.at(0).segments.at(0);
        EXPECT_EQ(segment.roadId, "1");
        EXPECT_EQ(segment.side, SegmentSide::Left);
        EXPECT_TRUE(doc.FindDanglingReferences().empty());
    }

    TEST(Reader, AdditionalDataIsKept)
    {
        const std::string children =
            "<userData code=\"vendor\" value=\"42\"><meta source=\"survey\"><point x=\"1\"/></meta></userData>"
            "<include file=\"extra.xml\"/>"
            "<dataQuality><error xyAbsolute=\"0.1\" zAbsolute=\"0.2\" xyRelative=\"0.01\" zRelative=\"0.02\"/></dataQuality>";
        auto doc = Parse(DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", "", children)));
        const auto& extra = doc.roads.front().extra;
        ASSERT_EQ(extra.userData.size(), 1u);
        EXPECT_EQ(extra.userData[0].code, "vendor");
        EXPECT_EQ(extra.userData[0].value, std::optional<std::string>("42"));
        ASSERT_EQ(extra.userData[0].content.size(), 1u);
        EXPECT_EQ(extra.userData[0].content[0].name, "meta");
        ASSERT_EQ(extra.userData[0].content[0].children.size(), 1u);
        ASSERT_EQ(extra.includes.size(), 1u);
        EXPECT_EQ(extra.includes[0].file, "extra.xml");
        ASSERT_EQ(extra.dataQuality.size(), 1u);
        ASSERT_TRUE(extra.dataQuality[0].error.has_value());
        EXPECT_EQ(extra.dataQuality[0].error->zRelative, 0.02);
    }

    TEST(Reader, OlderRevisionsAreAccepted)
    {
        auto doc = Parse(DocumentXml(RoadXml(), "<header revMajor=\"1\" revMinor=\"4\"/>"));
        EXPECT_EQ(doc.header.revMinor, 4u);
    }

    TEST(Reader, UnknownContentIsReported)
    {
        std::vector<Diagnostic> diagnostics;
        ReadOptions options;
        options.diagnostics = &diagnostics;
        auto xml = DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", " color=\"red\"", "<pavement/>"));
        auto doc = Parse(xml, options);
        EXPECT_EQ(doc.roads.size(), 1u);
        ASSERT_EQ(diagnostics.size(), 2u);
        EXPECT_NE(diagnostics[0].message.find("pavement"), std::string::npos);
        EXPECT_NE(diagnostics[1].message.find("color"), std::string::npos);
        EXPECT_EQ(diagnostics[1].path, "OpenDRIVE.road[0]");
    }

    TEST(Reader, RepeatedSingletonIsReported)
    {
        std::vector<Diagnostic> diagnostics;
        ReadOptions options;
        options.diagnostics = &diagnostics;
        auto xml = DocumentXml(RoadXml(), "<header revMajor=\"1\" revMinor=\"7\" name=\"first\"/><header revMajor=\"1\" revMinor=\"7\" name=\"second\"/>");
        auto doc = Parse(xml, options);
        EXPECT_EQ(doc.header.name, std::optional<std::string>("first"));
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_NE(diagnostics[0].message.find("repeated"), std::string::npos);
    }

    TEST(ReaderError, MalformedXml)
    {
        auto e = ExpectReadError(Declaration + "<OpenDRIVE>\n<header revMajor=\"1\"\n", ErrorKind::MalformedXml);
        EXPECT_GT(e.Line(), 0);
        ExpectReadError(Declaration + "<Road/>", ErrorKind::MalformedXml);
    }

    TEST(ReaderError, HeaderMustComeFirst)
    {
        ExpectReadError(Declaration + "<OpenDRIVE>" + RoadXml() + "</OpenDRIVE>", ErrorKind::MissingRequiredField);
        ExpectReadError(Declaration + "<OpenDRIVE/>", ErrorKind::MissingRequiredField);
    }

    TEST(ReaderError, UnsupportedVersion)
    {
        ExpectReadError(DocumentXml(RoadXml(), "<header revMajor=\"2\" revMinor=\"0\"/>"), ErrorKind::UnsupportedVersion);
        auto e = ExpectReadError(DocumentXml(RoadXml(), "<header revMajor=\"1\" revMinor=\"8\"/>"), ErrorKind::UnsupportedVersion);
        EXPECT_EQ(e.Field(), "revMinor");
        EXPECT_EQ(e.Raw(), "8");
    }

    TEST(ReaderError, MissingRequiredAttribute)
    {
        auto xml = DocumentXml("<road length=\"10\" junction=\"-1\"><planView>" + LineGeometry +
            "</planView><lanes>" + DefaultLaneSection + "</lanes></road>");
        auto e = ExpectReadError(xml, ErrorKind::MissingRequiredField);
        EXPECT_EQ(e.Path(), "OpenDRIVE.road[0]");
        EXPECT_EQ(e.Field(), "id");
    }

    TEST(ReaderError, MissingRequiredChildren)
    {
        ExpectReadError(DocumentXml("<road id=\"1\" length=\"10\" junction=\"-1\"><lanes>" + DefaultLaneSection + "</lanes></road>"),
            ErrorKind::MissingRequiredField);
        ExpectReadError(DocumentXml("<road id=\"1\" length=\"10\" junction=\"-1\"><planView>" + LineGeometry + "</planView></road>"),
            ErrorKind::MissingRequiredField);
        ExpectReadError(SingleRoadDocument("<geometry s=\"0\" x=\"0\" y=\"0\" hdg=\"0\" length=\"10\"/>"),
            ErrorKind::MissingRequiredField);
        ExpectReadError(SingleRoadDocument(""), ErrorKind::MissingRequiredField);
        ExpectReadError(SingleRoadDocument(LineGeometry, ""), ErrorKind::MissingRequiredField);
        ExpectReadError(DocumentXml(RoadXml() + "<junction id=\"j\"/>"), ErrorKind::MissingRequiredField);
        ExpectReadError(DocumentXml(RoadXml() + "<controller id=\"c\"/>"), ErrorKind::MissingRequiredField);
    }

    TEST(ReaderError, MissingRequiredFeatureChildren)
    {
        auto outline = ExpectReadError(DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", "",
            "<objects><object id=\"o\" s=\"0\" t=\"0\" zOffset=\"0\"><outline id=\"0\"/></object></objects>")),
            ErrorKind::MissingRequiredField);
        EXPECT_EQ(outline.Field(), "cornerRoad");

        auto track = ExpectReadError(DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", "",
            "<railroad><switch name=\"W\" id=\"w\" position=\"dynamic\"><sideTrack id=\"2\" s=\"0\" dir=\"+\"/>"
            "</switch></railroad>")), ErrorKind::MissingRequiredField);
        EXPECT_EQ(track.Field(), "mainTrack");

        auto group = ExpectReadError(DocumentXml(RoadXml() + "<junctionGroup id=\"g\" type=\"unknown\"/>"),
            ErrorKind::MissingRequiredField);
        EXPECT_EQ(group.Field(), "junctionReference");

        ExpectReadError(DocumentXml(RoadXml() + "<station id=\"s\" name=\"n\"/>"), ErrorKind::MissingRequiredField);
        ExpectReadError(DocumentXml(RoadXml() + "<station id=\"s\" name=\"n\"><platform id=\"p\"/></station>"),
            ErrorKind::MissingRequiredField);
        ExpectReadError(DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", "",
            "<objects><object id=\"o\" s=\"0\" t=\"0\" zOffset=\"0\"><markings><marking spaceLength=\"0\" "
            "lineLength=\"1\" startOffset=\"0\" stopOffset=\"0\"/></markings></object></objects>")),
            ErrorKind::MissingRequiredField);
    }

    TEST(ReaderError, InvalidEnumValue)
    {
        auto e = ExpectReadError(SingleRoadDocument(LineGeometry, LaneSectionWithRight(
            "<lane id=\"-1\" type=\"Driving\"/>")), ErrorKind::InvalidEnumValue);
        EXPECT_EQ(e.Field(), "type");
        EXPECT_EQ(e.Raw(), "Driving");
        EXPECT_EQ(e.Path(), "OpenDRIVE.road[0].lanes[0].laneSection[0].right[0].lane[0]");
    }

    TEST(ReaderError, MalformedNumber)
    {
        auto e = ExpectReadError(SingleRoadDocument(
            "<geometry s=\"0\" x=\"1.5m\" y=\"0\" hdg=\"0\" length=\"10\"><line/></geometry>"), ErrorKind::MalformedNumber);
        EXPECT_EQ(e.Field(), "x");
        EXPECT_EQ(e.Raw(), "1.5m");
        EXPECT_EQ(e.Path(), "OpenDRIVE.road[0].planView[0].geometry[0]");
    }

    TEST(ReaderError, NegativeLengthIsOutOfDomain)
    {
        ExpectReadError(SingleRoadDocument(LineGeometry, DefaultLaneSection, "-10"), ErrorKind::ValueOutOfDomain);
        ExpectReadError(SingleRoadDocument(
            "<geometry s=\"0\" x=\"0\" y=\"0\" hdg=\"0\" length=\"-1\"><line/></geometry>"), ErrorKind::ValueOutOfDomain);
    }

    TEST(ReaderError, MalformedID)
    {
        auto xml = DocumentXml("<road id=\" 1\" length=\"10\" junction=\"-1\"><planView>" + LineGeometry +
            "</planView><lanes>" + DefaultLaneSection + "</lanes></road>");
        ExpectReadError(xml, ErrorKind::UnresolvedReference);
    }

    TEST(ReaderError, CenterNeedsExactlyOneLane)
    {
        ExpectReadError(SingleRoadDocument(LineGeometry,
            "<laneSection s=\"0\"><center/></laneSection>"), ErrorKind::MissingRequiredField);
        ExpectReadError(SingleRoadDocument(LineGeometry,
            "<laneSection s=\"0\"><center><lane id=\"0\" type=\"none\"/><lane id=\"0\" type=\"none\"/></center></laneSection>"),
            ErrorKind::InvalidStructure);
        ExpectReadError(SingleRoadDocument(LineGeometry,
            "<laneSection s=\"0\"><right>" + RightLane(-1) + "</right></laneSection>"), ErrorKind::MissingRequiredField);
    }

    TEST(ReaderError, ErrorLineIsReported)
    {
        auto xml = Declaration + "<OpenDRIVE>\n" + DefaultHeader + "\n<road id=\"1\" length=\"abc\" junction=\"-1\">\n</road>\n</OpenDRIVE>\n";
        auto e = ExpectReadError(xml, ErrorKind::MalformedNumber);
        EXPECT_EQ(e.Line(), 4);
    }

    TEST(ReaderError, ParseFileMissing)
    {
        EXPECT_THROW(ParseFile("/nonexistent/dir/none.xodr"), std::runtime_error);
    }
}
