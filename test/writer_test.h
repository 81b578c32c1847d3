#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include <sstream>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "reader.h"
#include "writer.h"
#include "errors.h"
#include "validation.h"
#include "test_const.h"
#include "xodr_samples.h"

namespace XodrCodecTest
{
    using namespace XodrCodec;

    WriteError ExpectWriteError(const XodrCodec::Document& doc, ErrorKind kind)
    {
        try
        {
            Serialize(doc);
        }
        catch (const WriteError& e)
        {
            EXPECT_EQ(e.Kind(), kind) << e.what();
            return e;
        }
        ADD_FAILURE() << "Expected WriteError " << ToString(kind);
        return WriteError(kind, "", "", "", 0, "not thrown");
    }

    TEST(Writer, DeclarationComesFirst)
    {
        auto text = Serialize(Parse(SingleRoadDocument()));
        EXPECT_EQ(text.rfind("<?xml version=\"1.0\" standalone=\"yes\"?>", 0), 0u);
        EXPECT_NE(text.find("<OpenDRIVE>"), std::string::npos);
    }

    TEST(Writer, DefaultsAreOmitted)
    {
        auto text = Serialize(Parse(SingleRoadDocument(LineGeometry, LaneWithRoadMark(""))));
        EXPECT_EQ(text.find("rule="), std::string::npos);
        EXPECT_EQ(text.find("level="), std::string::npos);
        EXPECT_EQ(text.find("singleSide="), std::string::npos);
        EXPECT_EQ(text.find("laneChange="), std::string::npos);
        EXPECT_EQ(text.find("color="), std::string::npos);
        // road@junction has no default
        EXPECT_NE(text.find("junction=\"-1\""), std::string::npos);
    }

    TEST(Writer, AttributesFollowSchemaOrder)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.roads[0].name = "Main";
        doc.roads[0].rule = TrafficRule::LHT;
        auto text = Serialize(doc);
        EXPECT_NE(text.find("<road name=\"Main\" length=\"10\" id=\"1\" junction=\"-1\" rule=\"LHT\">"), std::string::npos);
        EXPECT_NE(text.find("<geometry s=\"0\" x=\"0\" y=\"0\" hdg=\"0\" length=\"10\">"), std::string::npos);
        EXPECT_NE(text.find("<width sOffset=\"0\" a=\"3.5\" b=\"0\" c=\"0\" d=\"0\""), std::string::npos);
    }

    TEST(Writer, ChildrenFollowSchemaOrder)
    {
        const std::string children =
            "<userData code=\"vendor\"/>"
            "<type s=\"0\" type=\"rural\"/>"
            "<link><successor elementType=\"road\" elementId=\"2\" contactPoint=\"start\"/></link>";
        auto text = Serialize(Parse(DocumentXml(RoadXml(LineGeometry, DefaultLaneSection, "10", "", children))));
        auto link = text.find("<link>");
        auto type = text.find("<type ");
        auto planView = text.find("<planView>");
        auto lanes = text.find("<lanes>");
        auto userData = text.find("<userData ");
        ASSERT_NE(userData, std::string::npos);
        EXPECT_LT(link, type);
        EXPECT_LT(type, planView);
        EXPECT_LT(planView, lanes);
        EXPECT_LT(lanes, userData);
    }

    TEST(Writer, FeatureChildrenFollowSchemaOrder)
    {
        const std::string children =
            "<railroad/>"
            "<surface><CRG file=\"r.crg\" sStart=\"0\" sEnd=\"10\" orientation=\"same\" mode=\"attached\"/></surface>"
            "<signals/>"
            "<objects><object id=\"o\" s=\"0\" t=\"0\" zOffset=\"0\">"
            "<surface><CRG file=\"o.crg\"/></surface>"
            "<borders><border width=\"0.1\" type=\"concrete\" outlineId=\"0\"/></borders>"
            "<markings><marking color=\"white\" spaceLength=\"0\" lineLength=\"1\" startOffset=\"0\" stopOffset=\"0\"/></markings>"
            "<parkingSpace access=\"all\"/>"
            "<material friction=\"0.5\"/>"
            "<outline><cornerLocal u=\"1\" v=\"0\" z=\"0\" height=\"0\"/><cornerRoad s=\"0\" t=\"0\" dz=\"0\" height=\"0\"/></outline>"
            "</object></objects>";
        const std::string body = RoadXml(LineGeometry, DefaultLaneSection, "10", "", children) +
            "<station id=\"st\" name=\"S\"><platform id=\"p\"><segment roadId=\"1\" sStart=\"0\" sEnd=\"5\" side=\"right\"/>"
            "</platform></station>"
            "<junctionGroup id=\"g\" type=\"unknown\"><junctionReference junction=\"j\"/></junctionGroup>"
            "<junction id=\"j\"><connection id=\"0\"/></junction>";
        auto doc = Parse(DocumentXml(body));
        auto text = Serialize(doc);

        auto outline = text.find("<outline>");
        auto cornerLocal = text.find("<cornerLocal ");
        auto cornerRoad = text.find("<cornerRoad ");
        auto material = text.find("<material ");
        auto parkingSpace = text.find("<parkingSpace ");
        auto markings = text.find("<markings>");
        auto borders = text.find("<borders>");
        auto objectCrg = text.find("<CRG file=\"o.crg\"");
        ASSERT_NE(objectCrg, std::string::npos);
        EXPECT_LT(outline, cornerLocal);
        EXPECT_LT(cornerLocal, cornerRoad);
        EXPECT_LT(cornerRoad, material);
        EXPECT_LT(material, parkingSpace);
        EXPECT_LT(parkingSpace, markings);
        EXPECT_LT(markings, borders);
        EXPECT_LT(borders, objectCrg);

        auto signals = text.find("<signals");
        auto roadCrg = text.find("<CRG file=\"r.crg\"");
        auto railroad = text.find("<railroad");
        ASSERT_NE(railroad, std::string::npos);
        EXPECT_LT(objectCrg, signals);
        EXPECT_LT(signals, roadCrg);
        EXPECT_LT(roadCrg, railroad);

        auto junction = text.find("<junction id=");
        auto group = text.find("<junctionGroup ");
        auto station = text.find("<station ");
        ASSERT_NE(station, std::string::npos);
        EXPECT_LT(railroad, junction);
        EXPECT_LT(junction, group);
        EXPECT_LT(group, station);
        EXPECT_EQ(Parse(text), doc);
    }

    TEST(Writer, NumbersAreShortestRoundTrip)
    {
        auto doc = Parse(SingleRoadDocument());
        std::get<LaneWidth>(doc.roads[0].lanes.laneSections[0].right[0].shape[0]).b = 0.1;
        auto text = Serialize(doc);
        EXPECT_NE(text.find("b=\"0.1\""), std::string::npos);
        EXPECT_EQ(Parse(text), doc);
    }

    TEST(Writer, OutputIsDeterministic)
    {
        auto doc = Parse(SingleRoadDocument());
        EXPECT_EQ(Serialize(doc), Serialize(doc));
        EXPECT_EQ(Serialize(Parse(Serialize(doc))), Serialize(doc));
    }

    TEST(Writer, GeoReferenceIsCData)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.header.geoReference = GeoReference{ "+proj=utm +zone=32 +ellps=WGS84 <&>", {} };
        auto text = Serialize(doc);
        EXPECT_NE(text.find("<![CDATA[+proj=utm +zone=32 +ellps=WGS84 <&>]]>"), std::string::npos);
        EXPECT_EQ(Parse(text).header.geoReference->projection, doc.header.geoReference->projection);
    }

    TEST(Writer, MarkupCharactersInTextSurvive)
    {
        const std::string awkward = "a & b < c > \"d\" 'e'\tf\ng ]]> \xC3\xA9\xE4\xB8\xAD";
        auto doc = Parse(SingleRoadDocument());
        doc.header.name = awkward;
        doc.header.geoReference = GeoReference{ "+proj=tmerc ]]> " + awkward, {} };

        auto& road = doc.roads[0];
        road.name = awkward;
        road.lanes.laneSections[0].right[0].rules.push_back(LaneRule{ Length(0), awkward });

        RoadObject object;
        object.id = "o1";
        object.name = awkward;
        object.subtype = awkward;
        road.objects = Objects{};
        road.objects->objects.push_back(object);

        OpaqueElement element;
        element.name = "note";
        element.attributes.emplace_back("text", awkward);
        element.text = "plain";
        UserData data;
        data.code = "vendor";
        data.value = awkward;
        data.content.push_back(element);
        road.extra.userData.push_back(data);

        auto text = Serialize(doc);
        EXPECT_NE(text.find("&amp;"), std::string::npos);
        EXPECT_NE(text.find("&lt;"), std::string::npos);
        EXPECT_NE(text.find("&quot;"), std::string::npos);
        EXPECT_NE(text.find("\xE4\xB8\xAD"), std::string::npos);
        EXPECT_EQ(Parse(text), doc);
        Validation::VerifyRoundTrip(doc);
    }

    TEST(WriterError, NonFiniteNumber)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.header.north = Length(std::numeric_limits<double>::infinity());
        auto e = ExpectWriteError(doc, ErrorKind::MalformedNumber);
        EXPECT_EQ(e.Field(), "north");
        EXPECT_EQ(e.Path(), "OpenDRIVE.header[0]");

        doc.header.north.reset();
        std::get<LaneWidth>(doc.roads[0].lanes.laneSections[0].right[0].shape[0]).a = std::nan("");
        ExpectWriteError(doc, ErrorKind::MalformedNumber);
    }

    TEST(WriterError, MalformedID)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.roads[0].id = "";
        ExpectWriteError(doc, ErrorKind::UnresolvedReference);
        doc.roads[0].id = "1 ";
        ExpectWriteError(doc, ErrorKind::UnresolvedReference);
    }

    TEST(WriterError, MissingChildren)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.controllers.push_back(Controller{ "c1", std::nullopt, std::nullopt, {}, {} });
        auto e = ExpectWriteError(doc, ErrorKind::MissingRequiredField);
        EXPECT_EQ(e.Path(), "OpenDRIVE.controller[0]");
        EXPECT_EQ(e.Field(), "control");

        doc.controllers.clear();
        Junction junction;
        junction.id = "j1";
        doc.junctions.push_back(junction);
        ExpectWriteError(doc, ErrorKind::MissingRequiredField);
    }

    TEST(WriterError, MissingFeatureChildren)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.junctionGroups.push_back(JunctionGroup{ "g", std::nullopt, JunctionGroupType::Unknown, {}, {} });
        auto e = ExpectWriteError(doc, ErrorKind::MissingRequiredField);
        EXPECT_EQ(e.Field(), "junctionReference");

        doc.junctionGroups.clear();
        RoadObject object;
        object.id = "o";
        object.outline = Outline{};
        doc.roads[0].objects = Objects{};
        doc.roads[0].objects->objects.push_back(object);
        e = ExpectWriteError(doc, ErrorKind::MissingRequiredField);
        EXPECT_EQ(e.Field(), "cornerRoad");

        doc.roads[0].objects.reset();
        doc.stations.push_back(Station{ "st", "S", std::nullopt, { Platform{ "p", std::nullopt, {}, {} } }, {} });
        e = ExpectWriteError(doc, ErrorKind::MissingRequiredField);
        EXPECT_EQ(e.Field(), "segment");
    }

    TEST(WriterError, BrokenRoadStructure)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.roads[0].planView.clear();
        ExpectWriteError(doc, ErrorKind::InvalidStructure);

        doc = Parse(SingleRoadDocument());
        doc.roads[0].length = Length(12);
        auto e = ExpectWriteError(doc, ErrorKind::InvalidStructure);
        EXPECT_EQ(e.Field(), "length");
    }

    TEST(WriterError, UnsupportedVersion)
    {
        auto doc = Parse(SingleRoadDocument());
        doc.header.revMinor = 9;
        ExpectWriteError(doc, ErrorKind::UnsupportedVersion);
    }

    TEST(Writer, SerializeLogsSummaryAtDebug)
    {
        std::ostringstream captured;
        auto logger = std::make_shared<spdlog::logger>("writer_capture",
            std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("%l %v");
        auto previous = spdlog::default_logger();
        spdlog::set_default_logger(logger);

        auto doc = Parse(SingleRoadDocument());
        Serialize(doc);

        spdlog::set_default_logger(previous);
        spdlog::drop("writer_capture");
        const auto text = captured.str();
        EXPECT_NE(text.find("debug Serialized OpenDRIVE 1.7: 1 roads, 0 junctions, 0 controllers"), std::string::npos)
            << text;
    }

    TEST(Writer, ExportFile)
    {
        auto doc = Parse(SingleRoadDocument());
        auto dir = std::filesystem::temp_directory_path() / "xodrcodec_writer_test";
        std::filesystem::create_directories(dir);
        auto first = (dir / "first.xodr").string();
        auto second = (dir / "second.xodr").string();

        ExportFile(doc, first);
        ExportFile(ParseFile(first), second);
        EXPECT_TRUE(Validation::CompareFiles(first, second));
        EXPECT_EQ(ParseFile(second), doc);

        EXPECT_THROW(ExportFile(doc, (dir / "missing" / "x.xodr").string()), std::runtime_error);
        std::filesystem::remove_all(dir);
    }
}
