#include "reader_detail.h"

#include <spdlog/spdlog.h>

namespace
{
    using namespace XodrCodec;

    RoadLinkElement ReadRoadLinkElement(ReadContext& ctx)
    {
        RoadLinkElement rtn;
        rtn.elementType = ctx.RequiredEnum<ElementType>("elementType");
        rtn.elementId = ctx.RequiredID("elementId");
        rtn.contactPoint = ctx.OptionalEnum<ContactPoint>("contactPoint");
        rtn.elementS = ctx.OptionalLength("elementS", Domain::NonNegative);
        rtn.elementDir = ctx.OptionalEnum<ElementDir>("elementDir");
        return rtn;
    }

    RoadLink ReadRoadLink(ReadContext& ctx)
    {
        RoadLink rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "predecessor"))
            {
                if (ctx.FirstOccurrence(child, rtn.predecessor.has_value()))
                {
                    rtn.predecessor = ReadRoadLinkElement(child);
                }
                return true;
            }
            if (Is(child, "successor"))
            {
                if (ctx.FirstOccurrence(child, rtn.successor.has_value()))
                {
                    rtn.successor = ReadRoadLinkElement(child);
                }
                return true;
            }
            return false;
        }, &rtn.extra);
        return rtn;
    }

    MaxSpeed ReadMaxSpeed(ReadContext& ctx)
    {
        auto raw = ctx.RequiredString("max");
        if (raw == "no limit")
        {
            return MaxSpeed::NoLimit();
        }
        if (raw == "undefined")
        {
            return MaxSpeed::Undefined();
        }
        double value = 0;
        if (ParseNumber(raw, value) != NumberFault::None)
        {
            ctx.Fail(ErrorKind::InvalidEnumValue, "max", raw, "expected a number, \"no limit\" or \"undefined\"");
        }
        if (value < 0)
        {
            ctx.Fail(ErrorKind::ValueOutOfDomain, "max", raw, "must not be negative");
        }
        return MaxSpeed::Limit(value);
    }

    RoadTypeRecord ReadRoadType(ReadContext& ctx)
    {
        RoadTypeRecord rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.type = ctx.RequiredEnum<RoadType>("type");
        rtn.country = ctx.OptionalString("country");
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "speed"))
            {
                return false;
            }
            if (ctx.FirstOccurrence(child, rtn.speed.has_value()))
            {
                RoadSpeed speed;
                speed.max = ReadMaxSpeed(child);
                speed.unit = child.DefaultedEnum<SpeedUnit>("unit", SpeedUnit::MetersPerSecond);
                rtn.speed = speed;
            }
            return true;
        });
        return rtn;
    }

    std::optional<GeometryShape> ReadShape(ReadContext& ctx)
    {
        if (Is(ctx, "line"))
        {
            return GeometryShape(LineShape{});
        }
        if (Is(ctx, "arc"))
        {
            return GeometryShape(ArcShape{ ctx.RequiredCurvature("curvature") });
        }
        if (Is(ctx, "spiral"))
        {
            return GeometryShape(SpiralShape{ ctx.RequiredCurvature("curvStart"), ctx.RequiredCurvature("curvEnd") });
        }
        if (Is(ctx, "poly3"))
        {
            Poly3Shape poly;
            poly.a = ctx.RequiredNumber("a");
            poly.b = ctx.RequiredNumber("b");
            poly.c = ctx.RequiredNumber("c");
            poly.d = ctx.RequiredNumber("d");
            return GeometryShape(poly);
        }
        if (Is(ctx, "paramPoly3"))
        {
            ParamPoly3Shape poly;
            poly.aU = ctx.RequiredNumber("aU");
            poly.bU = ctx.RequiredNumber("bU");
            poly.cU = ctx.RequiredNumber("cU");
            poly.dU = ctx.RequiredNumber("dU");
            poly.aV = ctx.RequiredNumber("aV");
            poly.bV = ctx.RequiredNumber("bV");
            poly.cV = ctx.RequiredNumber("cV");
            poly.dV = ctx.RequiredNumber("dV");
            if (ctx.Has("pRange"))
            {
                poly.pRange = ctx.RequiredEnum<ParamPoly3Range>("pRange");
            }
            else if (ctx.GetWorkarounds().IsEnabled(Workaround::SumoIssue10301))
            {
                poly.pRange = ParamPoly3Range::Normalized;
            }
            else
            {
                ctx.Fail(ErrorKind::MissingRequiredField, "pRange", "");
            }
            return GeometryShape(poly);
        }
        return std::nullopt;
    }

    Geometry ReadGeometry(ReadContext& ctx)
    {
        auto s = ctx.RequiredLength("s", Domain::NonNegative);
        auto x = ctx.RequiredLength("x");
        auto y = ctx.RequiredLength("y");
        auto hdg = ctx.RequiredAngle("hdg");
        auto length = ctx.RequiredLength("length", Domain::NonNegative);

        std::optional<GeometryShape> shape;
        AdditionalData extra;
        ctx.ForEachChild([&](ReadContext& child)
        {
            const bool known = Is(child, "line") || Is(child, "arc") || Is(child, "spiral") ||
                Is(child, "poly3") || Is(child, "paramPoly3");
            if (!known)
            {
                return false;
            }
            if (ctx.FirstOccurrence(child, shape.has_value()))
            {
                shape = ReadShape(child);
            }
            return true;
        }, &extra);

        if (!shape)
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "line|spiral|arc|poly3|paramPoly3", "",
                "geometry requires a shape element");
        }
        return Geometry(s, x, y, hdg, length, std::move(*shape), std::move(extra));
    }

    std::vector<Geometry> ReadPlanView(ReadContext& ctx)
    {
        std::vector<Geometry> rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "geometry"))
            {
                return false;
            }
            rtn.push_back(ReadGeometry(child));
            return true;
        });
        if (rtn.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "geometry", "", "planView requires at least one geometry");
        }
        return rtn;
    }

    ElevationProfile ReadElevationProfile(ReadContext& ctx)
    {
        ElevationProfile rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "elevation"))
            {
                return false;
            }
            rtn.elevations.push_back(ReadCubicRecord(child));
            return true;
        }, &rtn.extra);
        return rtn;
    }

    LateralProfile ReadLateralProfile(ReadContext& ctx)
    {
        LateralProfile rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "superelevation"))
            {
                rtn.superelevations.push_back(ReadCubicRecord(child));
                return true;
            }
            if (Is(child, "shape"))
            {
                LateralShape shape;
                shape.s = child.RequiredLength("s", Domain::NonNegative);
                shape.t = child.RequiredLength("t");
                shape.a = child.RequiredNumber("a");
                shape.b = child.RequiredNumber("b");
                shape.c = child.RequiredNumber("c");
                shape.d = child.RequiredNumber("d");
                rtn.shapes.push_back(shape);
                return true;
            }
            return false;
        }, &rtn.extra);
        return rtn;
    }

    // validity* children shared by objects, tunnels, bridges and references
    bool ReadValidityChild(ReadContext& child, std::vector<LaneValidity>& out)
    {
        if (!Is(child, "validity"))
        {
            return false;
        }
        out.push_back(ReadValidity(child));
        return true;
    }

    ObjectRepeat ReadRepeat(ReadContext& ctx)
    {
        ObjectRepeat rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.length = ctx.RequiredLength("length", Domain::NonNegative);
        rtn.distance = ctx.RequiredLength("distance", Domain::NonNegative);
        rtn.tStart = ctx.RequiredLength("tStart");
        rtn.tEnd = ctx.RequiredLength("tEnd");
        rtn.heightStart = ctx.RequiredLength("heightStart");
        rtn.heightEnd = ctx.RequiredLength("heightEnd");
        rtn.zOffsetStart = ctx.RequiredLength("zOffsetStart");
        rtn.zOffsetEnd = ctx.RequiredLength("zOffsetEnd");
        rtn.widthStart = ctx.OptionalLength("widthStart", Domain::NonNegative);
        rtn.widthEnd = ctx.OptionalLength("widthEnd", Domain::NonNegative);
        rtn.lengthStart = ctx.OptionalLength("lengthStart", Domain::NonNegative);
        rtn.lengthEnd = ctx.OptionalLength("lengthEnd", Domain::NonNegative);
        rtn.radiusStart = ctx.OptionalLength("radiusStart", Domain::NonNegative);
        rtn.radiusEnd = ctx.OptionalLength("radiusEnd", Domain::NonNegative);
        return rtn;
    }

    OutlineCorner ReadCornerRoad(ReadContext& ctx)
    {
        CornerRoad rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.t = ctx.RequiredLength("t");
        rtn.dz = ctx.RequiredLength("dz");
        rtn.height = ctx.RequiredLength("height");
        rtn.id = ctx.OptionalUnsigned("id");
        return rtn;
    }

    OutlineCorner ReadCornerLocal(ReadContext& ctx)
    {
        CornerLocal rtn;
        rtn.u = ctx.RequiredLength("u");
        rtn.v = ctx.RequiredLength("v");
        rtn.z = ctx.RequiredLength("z");
        rtn.height = ctx.RequiredLength("height");
        rtn.id = ctx.OptionalUnsigned("id");
        return rtn;
    }

    Outline ReadOutline(ReadContext& ctx)
    {
        Outline rtn;
        rtn.id = ctx.OptionalUnsigned("id");
        rtn.fillType = ctx.OptionalEnum<OutlineFillType>("fillType");
        rtn.outer = ctx.OptionalBool("outer");
        rtn.closed = ctx.OptionalBool("closed");
        rtn.laneType = ctx.OptionalEnum<LaneType>("laneType");
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "cornerRoad"))
            {
                rtn.corners.push_back(ReadCornerRoad(child));
            }
            else if (Is(child, "cornerLocal"))
            {
                rtn.corners.push_back(ReadCornerLocal(child));
            }
            else
            {
                return false;
            }
            return true;
        }, &rtn.extra);
        if (rtn.corners.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "cornerRoad", "", "outline requires at least one corner");
        }
        return rtn;
    }

    Outlines ReadOutlines(ReadContext& ctx)
    {
        Outlines rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "outline"))
            {
                return false;
            }
            rtn.outlines.push_back(ReadOutline(child));
            return true;
        }, &rtn.extra);
        if (rtn.outlines.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "outline", "", "outlines require at least one outline");
        }
        return rtn;
    }

    ObjectMaterial ReadObjectMaterial(ReadContext& ctx)
    {
        ObjectMaterial rtn;
        rtn.surface = ctx.OptionalString("surface");
        rtn.friction = ctx.OptionalNumber("friction", Domain::NonNegative);
        rtn.roughness = ctx.OptionalNumber("roughness", Domain::NonNegative);
        return rtn;
    }

    ParkingSpace ReadParkingSpace(ReadContext& ctx)
    {
        ParkingSpace rtn;
        rtn.access = ctx.RequiredEnum<ParkingAccess>("access");
        rtn.restrictions = ctx.OptionalString("restrictions");
        return rtn;
    }

    bool ReadCornerReference(ReadContext& child, std::vector<unsigned>& out)
    {
        if (!Is(child, "cornerReference"))
        {
            return false;
        }
        out.push_back(child.RequiredUnsigned("id"));
        return true;
    }

    ObjectMarking ReadObjectMarking(ReadContext& ctx)
    {
        ObjectMarking rtn;
        rtn.side = ctx.OptionalEnum<MarkingSide>("side");
        rtn.weight = ctx.OptionalEnum<RoadMarkWeight>("weight");
        rtn.width = ctx.OptionalLength("width", Domain::NonNegative);
        rtn.color = ctx.RequiredEnum<RoadMarkColor>("color");
        rtn.zOffset = ctx.OptionalLength("zOffset", Domain::NonNegative);
        rtn.spaceLength = ctx.RequiredLength("spaceLength", Domain::NonNegative);
        rtn.lineLength = ctx.RequiredLength("lineLength", Domain::NonNegative);
        rtn.startOffset = ctx.RequiredLength("startOffset");
        rtn.stopOffset = ctx.RequiredLength("stopOffset");
        ctx.ForEachChild([&](ReadContext& child) { return ReadCornerReference(child, rtn.cornerReferences); },
            &rtn.extra);
        return rtn;
    }

    ObjectMarkings ReadObjectMarkings(ReadContext& ctx)
    {
        ObjectMarkings rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "marking"))
            {
                return false;
            }
            rtn.markings.push_back(ReadObjectMarking(child));
            return true;
        }, &rtn.extra);
        if (rtn.markings.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "marking", "", "markings require at least one marking");
        }
        return rtn;
    }

    ObjectBorder ReadObjectBorder(ReadContext& ctx)
    {
        ObjectBorder rtn;
        rtn.width = ctx.RequiredLength("width", Domain::NonNegative);
        rtn.type = ctx.RequiredEnum<ObjectBorderType>("type");
        rtn.outlineId = ctx.RequiredUnsigned("outlineId");
        rtn.useCompleteOutline = ctx.OptionalBool("useCompleteOutline");
        ctx.ForEachChild([&](ReadContext& child) { return ReadCornerReference(child, rtn.cornerReferences); },
            &rtn.extra);
        return rtn;
    }

    ObjectBorders ReadObjectBorders(ReadContext& ctx)
    {
        ObjectBorders rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "border"))
            {
                return false;
            }
            rtn.borders.push_back(ReadObjectBorder(child));
            return true;
        }, &rtn.extra);
        if (rtn.borders.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "border", "", "borders require at least one border");
        }
        return rtn;
    }

    ObjectSurface ReadObjectSurface(ReadContext& ctx)
    {
        ObjectSurface rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "CRG"))
            {
                return false;
            }
            if (ctx.FirstOccurrence(child, rtn.crg.has_value()))
            {
                ObjectCrg crg;
                crg.file = child.OptionalString("file");
                crg.hideRoadSurfaceCRG = child.OptionalBool("hideRoadSurfaceCRG");
                crg.zScale = child.OptionalNumber("zScale");
                rtn.crg = crg;
            }
            return true;
        }, &rtn.extra);
        return rtn;
    }

    RoadObject ReadObject(ReadContext& ctx)
    {
        RoadObject rtn;
        rtn.id = ctx.RequiredID("id");
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.t = ctx.RequiredLength("t");
        rtn.zOffset = ctx.RequiredLength("zOffset");
        rtn.type = ctx.OptionalEnum<ObjectType>("type");
        rtn.subtype = ctx.OptionalString("subtype");
        rtn.name = ctx.OptionalString("name");
        rtn.validLength = ctx.OptionalLength("validLength", Domain::NonNegative);
        rtn.orientation = ctx.OptionalEnum<Orientation>("orientation");
        rtn.length = ctx.OptionalLength("length", Domain::NonNegative);
        rtn.width = ctx.OptionalLength("width", Domain::NonNegative);
        rtn.radius = ctx.OptionalLength("radius", Domain::NonNegative);
        rtn.height = ctx.OptionalLength("height", Domain::NonNegative);
        rtn.hdg = ctx.OptionalAngle("hdg");
        rtn.pitch = ctx.OptionalAngle("pitch");
        rtn.roll = ctx.OptionalAngle("roll");
        rtn.dynamic = ctx.OptionalYesNo("dynamic");
        rtn.perpToRoad = ctx.OptionalBool("perpToRoad");

        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "repeat"))
            {
                rtn.repeats.push_back(ReadRepeat(child));
            }
            else if (Is(child, "outline"))
            {
                if (ctx.FirstOccurrence(child, rtn.outline.has_value()))
                {
                    rtn.outline = ReadOutline(child);
                }
            }
            else if (Is(child, "outlines"))
            {
                if (ctx.FirstOccurrence(child, rtn.outlines.has_value()))
                {
                    rtn.outlines = ReadOutlines(child);
                }
            }
            else if (Is(child, "material"))
            {
                rtn.materials.push_back(ReadObjectMaterial(child));
            }
            else if (Is(child, "parkingSpace"))
            {
                if (ctx.FirstOccurrence(child, rtn.parkingSpace.has_value()))
                {
                    rtn.parkingSpace = ReadParkingSpace(child);
                }
            }
            else if (Is(child, "markings"))
            {
                if (ctx.FirstOccurrence(child, rtn.markings.has_value()))
                {
                    rtn.markings = ReadObjectMarkings(child);
                }
            }
            else if (Is(child, "borders"))
            {
                if (ctx.FirstOccurrence(child, rtn.borders.has_value()))
                {
                    rtn.borders = ReadObjectBorders(child);
                }
            }
            else if (Is(child, "surface"))
            {
                if (ctx.FirstOccurrence(child, rtn.surface.has_value()))
                {
                    rtn.surface = ReadObjectSurface(child);
                }
            }
            else
            {
                return ReadValidityChild(child, rtn.validities);
            }
            return true;
        }, &rtn.extra);
        return rtn;
    }

    ObjectReference ReadObjectReference(ReadContext& ctx)
    {
        ObjectReference rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.t = ctx.RequiredLength("t");
        rtn.id = ctx.RequiredID("id");
        rtn.zOffset = ctx.OptionalLength("zOffset");
        rtn.validLength = ctx.OptionalLength("validLength", Domain::NonNegative);
        rtn.orientation = ctx.RequiredEnum<Orientation>("orientation");
        ctx.ForEachChild([&](ReadContext& child) { return ReadValidityChild(child, rtn.validities); });
        return rtn;
    }

    Tunnel ReadTunnel(ReadContext& ctx)
    {
        Tunnel rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.length = ctx.RequiredLength("length", Domain::NonNegative);
        rtn.name = ctx.OptionalString("name");
        rtn.id = ctx.RequiredID("id");
        rtn.type = ctx.RequiredEnum<TunnelType>("type");
        rtn.lighting = ctx.OptionalNumber("lighting");
        rtn.daylight = ctx.OptionalNumber("daylight");
        ctx.ForEachChild([&](ReadContext& child) { return ReadValidityChild(child, rtn.validities); });
        return rtn;
    }

    Bridge ReadBridge(ReadContext& ctx)
    {
        Bridge rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.length = ctx.RequiredLength("length", Domain::NonNegative);
        rtn.name = ctx.OptionalString("name");
        rtn.id = ctx.RequiredID("id");
        rtn.type = ctx.RequiredEnum<BridgeType>("type");
        ctx.ForEachChild([&](ReadContext& child) { return ReadValidityChild(child, rtn.validities); });
        return rtn;
    }

    Objects ReadObjects(ReadContext& ctx)
    {
        Objects rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "object"))
            {
                rtn.objects.push_back(ReadObject(child));
            }
            else if (Is(child, "objectReference"))
            {
                rtn.references.push_back(ReadObjectReference(child));
            }
            else if (Is(child, "tunnel"))
            {
                rtn.tunnels.push_back(ReadTunnel(child));
            }
            else if (Is(child, "bridge"))
            {
                rtn.bridges.push_back(ReadBridge(child));
            }
            else
            {
                return false;
            }
            return true;
        }, &rtn.extra);
        return rtn;
    }

    SignalPositionRoad ReadPositionRoad(ReadContext& ctx)
    {
        SignalPositionRoad rtn;
        rtn.roadId = ctx.RequiredID("roadId");
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.t = ctx.RequiredLength("t");
        rtn.zOffset = ctx.RequiredLength("zOffset");
        rtn.hOffset = ctx.RequiredAngle("hOffset");
        rtn.pitch = ctx.OptionalAngle("pitch");
        rtn.roll = ctx.OptionalAngle("roll");
        return rtn;
    }

    SignalPositionInertial ReadPositionInertial(ReadContext& ctx)
    {
        SignalPositionInertial rtn;
        rtn.x = ctx.RequiredLength("x");
        rtn.y = ctx.RequiredLength("y");
        rtn.z = ctx.RequiredLength("z");
        rtn.hdg = ctx.RequiredAngle("hdg");
        rtn.pitch = ctx.OptionalAngle("pitch");
        rtn.roll = ctx.OptionalAngle("roll");
        return rtn;
    }

    Signal ReadSignal(ReadContext& ctx)
    {
        Signal rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.t = ctx.RequiredLength("t");
        rtn.id = ctx.RequiredID("id");
        rtn.name = ctx.OptionalString("name");
        rtn.dynamic = ctx.RequiredYesNo("dynamic");
        rtn.orientation = ctx.RequiredEnum<Orientation>("orientation");
        rtn.zOffset = ctx.RequiredLength("zOffset");
        rtn.country = ctx.OptionalString("country");
        rtn.countryRevision = ctx.OptionalString("countryRevision");
        rtn.type = ctx.RequiredString("type");
        rtn.subtype = ctx.RequiredString("subtype");
        rtn.value = ctx.OptionalNumber("value");
        rtn.unit = ctx.OptionalEnum<SignalUnit>("unit");
        rtn.height = ctx.OptionalLength("height", Domain::NonNegative);
        rtn.width = ctx.OptionalLength("width", Domain::NonNegative);
        rtn.text = ctx.OptionalString("text");
        rtn.hOffset = ctx.OptionalAngle("hOffset");
        rtn.pitch = ctx.OptionalAngle("pitch");
        rtn.roll = ctx.OptionalAngle("roll");

        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "dependency"))
            {
                rtn.dependencies.push_back(SignalDependency{ child.RequiredID("id"), child.OptionalString("type") });
                return true;
            }
            if (Is(child, "reference"))
            {
                SignalLinkedElement linked;
                linked.elementType = child.RequiredEnum<SignalElementType>("elementType");
                linked.elementId = child.RequiredID("elementId");
                linked.type = child.OptionalString("type");
                rtn.references.push_back(linked);
                return true;
            }
            if (Is(child, "positionRoad") || Is(child, "positionInertial"))
            {
                if (ctx.FirstOccurrence(child, rtn.position.has_value()))
                {
                    if (Is(child, "positionRoad"))
                    {
                        rtn.position = SignalPosition(ReadPositionRoad(child));
                    }
                    else
                    {
                        rtn.position = SignalPosition(ReadPositionInertial(child));
                    }
                }
                return true;
            }
            return ReadValidityChild(child, rtn.validities);
        }, &rtn.extra);
        return rtn;
    }

    SignalReference ReadSignalReference(ReadContext& ctx)
    {
        SignalReference rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.t = ctx.RequiredLength("t");
        rtn.id = ctx.RequiredID("id");
        rtn.orientation = ctx.RequiredEnum<Orientation>("orientation");
        ctx.ForEachChild([&](ReadContext& child) { return ReadValidityChild(child, rtn.validities); });
        return rtn;
    }

    Signals ReadSignals(ReadContext& ctx)
    {
        Signals rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "signal"))
            {
                rtn.signals.push_back(ReadSignal(child));
                return true;
            }
            if (Is(child, "signalReference"))
            {
                rtn.references.push_back(ReadSignalReference(child));
                return true;
            }
            return false;
        }, &rtn.extra);
        return rtn;
    }
}

namespace
{
    RoadCrg ReadRoadCrg(ReadContext& ctx)
    {
        RoadCrg rtn;
        rtn.file = ctx.RequiredString("file");
        rtn.sStart = ctx.RequiredLength("sStart", Domain::NonNegative);
        rtn.sEnd = ctx.RequiredLength("sEnd", Domain::NonNegative);
        rtn.orientation = ctx.RequiredEnum<CrgOrientation>("orientation");
        rtn.mode = ctx.RequiredEnum<RoadCrgMode>("mode");
        rtn.purpose = ctx.OptionalEnum<CrgPurpose>("purpose");
        rtn.sOffset = ctx.OptionalLength("sOffset");
        rtn.tOffset = ctx.OptionalLength("tOffset");
        rtn.zOffset = ctx.OptionalLength("zOffset");
        rtn.zScale = ctx.OptionalNumber("zScale");
        rtn.hOffset = ctx.OptionalAngle("hOffset");
        return rtn;
    }

    RoadSurface ReadRoadSurface(ReadContext& ctx)
    {
        RoadSurface rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "CRG"))
            {
                return false;
            }
            rtn.crgs.push_back(ReadRoadCrg(child));
            return true;
        }, &rtn.extra);
        return rtn;
    }
}

namespace XodrCodec
{
    Road ReadRoad(ReadContext& ctx)
    {
        Road rtn;
        rtn.name = ctx.OptionalString("name");
        rtn.length = ctx.RequiredLength("length", Domain::NonNegative);
        rtn.id = ctx.RequiredID("id");
        rtn.junction = ctx.RequiredID("junction");
        rtn.rule = ctx.DefaultedEnum<TrafficRule>("rule", TrafficRule::RHT);

        bool planViewSeen = false, lanesSeen = false;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "link"))
            {
                if (ctx.FirstOccurrence(child, rtn.link.has_value()))
                {
                    rtn.link = ReadRoadLink(child);
                }
            }
            else if (Is(child, "type"))
            {
                rtn.types.push_back(ReadRoadType(child));
            }
            else if (Is(child, "planView"))
            {
                if (ctx.FirstOccurrence(child, planViewSeen))
                {
                    planViewSeen = true;
                    rtn.planView = ReadPlanView(child);
                }
            }
            else if (Is(child, "elevationProfile"))
            {
                if (ctx.FirstOccurrence(child, rtn.elevationProfile.has_value()))
                {
                    rtn.elevationProfile = ReadElevationProfile(child);
                }
            }
            else if (Is(child, "lateralProfile"))
            {
                if (ctx.FirstOccurrence(child, rtn.lateralProfile.has_value()))
                {
                    rtn.lateralProfile = ReadLateralProfile(child);
                }
            }
            else if (Is(child, "lanes"))
            {
                if (ctx.FirstOccurrence(child, lanesSeen))
                {
                    lanesSeen = true;
                    rtn.lanes = ReadLanes(child);
                }
            }
            else if (Is(child, "objects"))
            {
                if (ctx.FirstOccurrence(child, rtn.objects.has_value()))
                {
                    rtn.objects = ReadObjects(child);
                }
            }
            else if (Is(child, "signals"))
            {
                if (ctx.FirstOccurrence(child, rtn.signals.has_value()))
                {
                    rtn.signals = ReadSignals(child);
                }
            }
            else if (Is(child, "surface"))
            {
                if (ctx.FirstOccurrence(child, rtn.surface.has_value()))
                {
                    rtn.surface = ReadRoadSurface(child);
                }
            }
            else if (Is(child, "railroad"))
            {
                if (ctx.FirstOccurrence(child, rtn.railroad.has_value()))
                {
                    rtn.railroad = ReadRailroad(child);
                }
            }
            else
            {
                return false;
            }
            return true;
        }, &rtn.extra);

        if (!planViewSeen)
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "planView", "");
        }
        if (!lanesSeen)
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "lanes", "");
        }
        return rtn;
    }
}
