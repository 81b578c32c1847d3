#include "reader.h"
#include "reader_detail.h"
#include "version.h"

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace
{
    using namespace XodrCodec;

    GeoReference ReadGeoReference(ReadContext& ctx)
    {
        GeoReference rtn;
        rtn.projection = ctx.Text();
        ctx.ForEachChild([](ReadContext&) { return false; }, &rtn.extra);
        return rtn;
    }

    HeaderOffset ReadHeaderOffset(ReadContext& ctx)
    {
        HeaderOffset rtn;
        rtn.x = ctx.RequiredLength("x");
        rtn.y = ctx.RequiredLength("y");
        rtn.z = ctx.RequiredLength("z");
        rtn.hdg = ctx.RequiredAngle("hdg");
        ctx.ForEachChild([](ReadContext&) { return false; }, &rtn.extra);
        return rtn;
    }

    Header ReadHeader(ReadContext& ctx)
    {
        Header rtn;
        rtn.revMajor = ctx.RequiredUnsigned("revMajor");
        rtn.revMinor = ctx.RequiredUnsigned("revMinor");
        if (rtn.revMajor != StandardRevMajor)
        {
            ctx.Fail(ErrorKind::UnsupportedVersion, "revMajor", std::to_string(rtn.revMajor),
                fmt::format("only OpenDRIVE {}.x is supported", StandardRevMajor));
        }
        if (rtn.revMinor > StandardRevMinor)
        {
            ctx.Fail(ErrorKind::UnsupportedVersion, "revMinor", std::to_string(rtn.revMinor),
                fmt::format("newest supported revision is {}.{}", StandardRevMajor, StandardRevMinor));
        }
        rtn.name = ctx.OptionalString("name");
        rtn.version = ctx.OptionalString("version");
        rtn.date = ctx.OptionalString("date");
        rtn.north = ctx.OptionalLength("north");
        rtn.south = ctx.OptionalLength("south");
        rtn.east = ctx.OptionalLength("east");
        rtn.west = ctx.OptionalLength("west");
        rtn.vendor = ctx.OptionalString("vendor");

        ctx.ForEachChild([&](ReadContext& child)
        {
            const std::string name = child.Name();
            if (name == "geoReference")
            {
                if (ctx.FirstOccurrence(child, rtn.geoReference.has_value()))
                {
                    rtn.geoReference = ReadGeoReference(child);
                }
                return true;
            }
            if (name == "offset")
            {
                if (ctx.FirstOccurrence(child, rtn.offset.has_value()))
                {
                    rtn.offset = ReadHeaderOffset(child);
                }
                return true;
            }
            return false;
        }, &rtn.extra);
        return rtn;
    }

    Controller ReadController(ReadContext& ctx)
    {
        Controller rtn;
        rtn.id = ctx.RequiredID("id");
        rtn.name = ctx.OptionalString("name");
        rtn.sequence = ctx.OptionalUnsigned("sequence");
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (std::string(child.Name()) != "control")
            {
                return false;
            }
            ControllerControl control;
            control.signalId = child.RequiredID("signalId");
            control.type = child.OptionalString("type");
            rtn.controls.push_back(control);
            return true;
        }, &rtn.extra);

        if (rtn.controls.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "control", "", "controller requires at least one control");
        }
        return rtn;
    }
}

namespace XodrCodec
{
    LaneValidity ReadValidity(ReadContext& ctx)
    {
        LaneValidity rtn;
        rtn.fromLane = ctx.RequiredInt("fromLane");
        rtn.toLane = ctx.RequiredInt("toLane");
        return rtn;
    }

    CubicRecord ReadCubicRecord(ReadContext& ctx)
    {
        CubicRecord rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.a = ctx.RequiredNumber("a");
        rtn.b = ctx.RequiredNumber("b");
        rtn.c = ctx.RequiredNumber("c");
        rtn.d = ctx.RequiredNumber("d");
        return rtn;
    }

    void ThrowIfViolated(const ReadContext& ctx, const std::vector<StructureViolation>& violations)
    {
        if (!violations.empty())
        {
            const auto& v = violations.front();
            throw ReadError(ErrorKind::InvalidStructure, v.path, v.field, v.raw, ctx.Line(), v.message);
        }
    }

    Document Parse(const std::string& xml, const ReadOptions& options)
    {
        pugi::xml_document doc;
        pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
        ReadSession session(xml, options);
        if (!result)
        {
            throw ReadError(ErrorKind::MalformedXml, "", "", "", session.LineOf(result.offset),
                result.description());
        }

        auto root = doc.document_element();
        if (!root || std::string(root.name()) != "OpenDRIVE")
        {
            throw ReadError(ErrorKind::MalformedXml, root ? root.name() : "", "", "", 0,
                "root element must be <OpenDRIVE>");
        }

        Document rtn;
        bool headerSeen = false;
        ReadContext ctx(root, "OpenDRIVE", session);
        ctx.ForEachChild([&](ReadContext& child)
        {
            const std::string name = child.Name();
            if (name == "header")
            {
                if (ctx.FirstOccurrence(child, headerSeen))
                {
                    headerSeen = true;
                    rtn.header = ReadHeader(child);
                }
                return true;
            }
            if (!headerSeen)
            {
                // Version decides the grammar; nothing is mapped before it is known
                child.Fail(ErrorKind::MissingRequiredField, "header", "", "<header> must be the first element");
            }
            if (name == "road")
            {
                auto road = ReadRoad(child);
                ThrowIfViolated(child, CheckRoadStructure(road, child.Path()));
                if (options.verifyContinuity)
                {
                    auto gaps = FindGeometryDiscontinuities(road, options.continuityTolerance);
                    if (!gaps.empty())
                    {
                        child.Fail(ErrorKind::InvalidStructure, "geometry",
                            std::to_string(gaps.front().index + 1),
                            fmt::format("reference line breaks (position {}, heading {})",
                                gaps.front().positionGap, gaps.front().headingGap));
                    }
                }
                spdlog::debug("Read road {} ({} geometries, {} lane sections)", road.id,
                    road.planView.size(), road.lanes.laneSections.size());
                rtn.roads.push_back(std::move(road));
                return true;
            }
            if (name == "controller")
            {
                rtn.controllers.push_back(ReadController(child));
                return true;
            }
            if (name == "junction")
            {
                auto junction = ReadJunction(child);
                spdlog::debug("Read junction {} ({} connections)", junction.id, junction.connections.size());
                rtn.junctions.push_back(std::move(junction));
                return true;
            }
            if (name == "junctionGroup")
            {
                rtn.junctionGroups.push_back(ReadJunctionGroup(child));
                return true;
            }
            if (name == "station")
            {
                rtn.stations.push_back(ReadStation(child));
                return true;
            }
            return false;
        }, &rtn.extra);
        ctx.Finish();

        if (!headerSeen)
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "header", "");
        }

        spdlog::info("Parsed OpenDRIVE {}.{}: {} roads, {} junctions, {} controllers, {} diagnostics",
            rtn.header.revMajor, rtn.header.revMinor, rtn.roads.size(), rtn.junctions.size(),
            rtn.controllers.size(), session.DiagnosticCount());
        return rtn;
    }

    Document ParseFile(const std::string& path, const ReadOptions& options)
    {
        std::ifstream inFile(path, std::ios::binary);
        if (!inFile)
        {
            throw std::runtime_error("Cannot open " + path);
        }
        std::stringstream buffer;
        buffer << inFile.rdbuf();
        return Parse(buffer.str(), options);
    }
}
