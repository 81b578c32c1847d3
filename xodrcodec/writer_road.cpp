#include "writer_detail.h"

#include <spdlog/spdlog.h>

namespace
{
    using namespace XodrCodec;

    void WriteRoadLinkElement(WriteContext ctx, const RoadLinkElement& element)
    {
        ctx.Put("elementType", element.elementType);
        ctx.PutID("elementId", element.elementId);
        ctx.Put("contactPoint", element.contactPoint);
        ctx.Put("elementS", element.elementS);
        ctx.Put("elementDir", element.elementDir);
    }

    void WriteMaxSpeed(WriteContext& ctx, const MaxSpeed& max)
    {
        switch (max.kind)
        {
        case SpeedLimitKind::Limit:
            ctx.Put("max", max.value);
            break;
        case SpeedLimitKind::NoLimit:
            ctx.Put("max", "no limit");
            break;
        case SpeedLimitKind::Undefined:
            ctx.Put("max", "undefined");
            break;
        }
    }

    struct ShapeWriter
    {
        WriteContext& geometry;

        void operator()(const LineShape& line) const
        {
            geometry.Child(ShapeElementName(line));
        }

        void operator()(const SpiralShape& spiral) const
        {
            auto child = geometry.Child(ShapeElementName(spiral));
            child.Put("curvStart", spiral.curvStart);
            child.Put("curvEnd", spiral.curvEnd);
        }

        void operator()(const ArcShape& arc) const
        {
            geometry.Child(ShapeElementName(arc)).Put("curvature", arc.curvature);
        }

        void operator()(const Poly3Shape& poly) const
        {
            auto child = geometry.Child(ShapeElementName(poly));
            child.Put("a", poly.a);
            child.Put("b", poly.b);
            child.Put("c", poly.c);
            child.Put("d", poly.d);
        }

        // pRange is written under every workaround set
        void operator()(const ParamPoly3Shape& poly) const
        {
            auto child = geometry.Child(ShapeElementName(poly));
            child.Put("aU", poly.aU);
            child.Put("bU", poly.bU);
            child.Put("cU", poly.cU);
            child.Put("dU", poly.dU);
            child.Put("aV", poly.aV);
            child.Put("bV", poly.bV);
            child.Put("cV", poly.cV);
            child.Put("dV", poly.dV);
            child.Put("pRange", poly.pRange);
        }
    };

    void WritePlanView(WriteContext& ctx, const std::vector<Geometry>& planView)
    {
        ctx.RequireNonEmpty(planView, "geometry");
        for (const auto& geometry : planView)
        {
            auto child = ctx.Child("geometry");
            child.Put("s", geometry.S());
            child.Put("x", geometry.X());
            child.Put("y", geometry.Y());
            child.Put("hdg", geometry.Hdg());
            child.Put("length", geometry.GetLength());
            std::visit(ShapeWriter{ child }, geometry.Shape());
            child.PutExtra(geometry.Extra());
        }
    }

    void WriteRepeat(WriteContext ctx, const ObjectRepeat& repeat)
    {
        ctx.Put("s", repeat.s);
        ctx.Put("length", repeat.length);
        ctx.Put("distance", repeat.distance);
        ctx.Put("tStart", repeat.tStart);
        ctx.Put("tEnd", repeat.tEnd);
        ctx.Put("heightStart", repeat.heightStart);
        ctx.Put("heightEnd", repeat.heightEnd);
        ctx.Put("zOffsetStart", repeat.zOffsetStart);
        ctx.Put("zOffsetEnd", repeat.zOffsetEnd);
        ctx.Put("widthStart", repeat.widthStart);
        ctx.Put("widthEnd", repeat.widthEnd);
        ctx.Put("lengthStart", repeat.lengthStart);
        ctx.Put("lengthEnd", repeat.lengthEnd);
        ctx.Put("radiusStart", repeat.radiusStart);
        ctx.Put("radiusEnd", repeat.radiusEnd);
    }

    void WriteValidities(WriteContext& ctx, const std::vector<LaneValidity>& validities)
    {
        for (const auto& validity : validities)
        {
            WriteValidity(ctx, validity);
        }
    }

    struct CornerWriter
    {
        WriteContext& outline;

        void operator()(const CornerRoad& corner) const
        {
            auto child = outline.Child("cornerRoad");
            child.Put("s", corner.s);
            child.Put("t", corner.t);
            child.Put("dz", corner.dz);
            child.Put("height", corner.height);
            child.Put("id", corner.id);
        }

        void operator()(const CornerLocal& corner) const
        {
            auto child = outline.Child("cornerLocal");
            child.Put("u", corner.u);
            child.Put("v", corner.v);
            child.Put("z", corner.z);
            child.Put("height", corner.height);
            child.Put("id", corner.id);
        }
    };

    void WriteOutline(WriteContext ctx, const Outline& outline)
    {
        ctx.Put("id", outline.id);
        ctx.Put("fillType", outline.fillType);
        ctx.Put("outer", outline.outer);
        ctx.Put("closed", outline.closed);
        ctx.Put("laneType", outline.laneType);
        ctx.RequireNonEmpty(outline.corners, "cornerRoad");
        for (const auto& corner : outline.corners)
        {
            std::visit(CornerWriter{ ctx }, corner);
        }
        ctx.PutExtra(outline.extra);
    }

    void WriteCornerReferences(WriteContext& ctx, const std::vector<unsigned>& ids)
    {
        for (unsigned id : ids)
        {
            ctx.Child("cornerReference").Put("id", id);
        }
    }

    void WriteMarkings(WriteContext ctx, const ObjectMarkings& markings)
    {
        ctx.RequireNonEmpty(markings.markings, "marking");
        for (const auto& marking : markings.markings)
        {
            auto child = ctx.Child("marking");
            child.Put("side", marking.side);
            child.Put("weight", marking.weight);
            child.Put("width", marking.width);
            child.Put("color", marking.color);
            child.Put("zOffset", marking.zOffset);
            child.Put("spaceLength", marking.spaceLength);
            child.Put("lineLength", marking.lineLength);
            child.Put("startOffset", marking.startOffset);
            child.Put("stopOffset", marking.stopOffset);
            WriteCornerReferences(child, marking.cornerReferences);
            child.PutExtra(marking.extra);
        }
        ctx.PutExtra(markings.extra);
    }

    void WriteBorders(WriteContext ctx, const ObjectBorders& borders)
    {
        ctx.RequireNonEmpty(borders.borders, "border");
        for (const auto& border : borders.borders)
        {
            auto child = ctx.Child("border");
            child.Put("width", border.width);
            child.Put("type", border.type);
            child.Put("outlineId", border.outlineId);
            child.Put("useCompleteOutline", border.useCompleteOutline);
            WriteCornerReferences(child, border.cornerReferences);
            child.PutExtra(border.extra);
        }
        ctx.PutExtra(borders.extra);
    }

    void WriteObjectChildren(WriteContext& ctx, const RoadObject& object)
    {
        for (const auto& repeat : object.repeats)
        {
            WriteRepeat(ctx.Child("repeat"), repeat);
        }
        if (object.outline)
        {
            WriteOutline(ctx.Child("outline"), *object.outline);
        }
        if (object.outlines)
        {
            auto outlines = ctx.Child("outlines");
            outlines.RequireNonEmpty(object.outlines->outlines, "outline");
            for (const auto& outline : object.outlines->outlines)
            {
                WriteOutline(outlines.Child("outline"), outline);
            }
            outlines.PutExtra(object.outlines->extra);
        }
        for (const auto& material : object.materials)
        {
            auto child = ctx.Child("material");
            child.Put("surface", material.surface);
            child.Put("friction", material.friction);
            child.Put("roughness", material.roughness);
        }
        WriteValidities(ctx, object.validities);
        if (object.parkingSpace)
        {
            auto child = ctx.Child("parkingSpace");
            child.Put("access", object.parkingSpace->access);
            child.Put("restrictions", object.parkingSpace->restrictions);
        }
        if (object.markings)
        {
            WriteMarkings(ctx.Child("markings"), *object.markings);
        }
        if (object.borders)
        {
            WriteBorders(ctx.Child("borders"), *object.borders);
        }
        if (object.surface)
        {
            auto surface = ctx.Child("surface");
            if (object.surface->crg)
            {
                auto crg = surface.Child("CRG");
                crg.Put("file", object.surface->crg->file);
                crg.Put("hideRoadSurfaceCRG", object.surface->crg->hideRoadSurfaceCRG);
                crg.Put("zScale", object.surface->crg->zScale);
            }
            surface.PutExtra(object.surface->extra);
        }
    }

    void WriteRoadSurface(WriteContext ctx, const RoadSurface& surface)
    {
        for (const auto& crg : surface.crgs)
        {
            auto child = ctx.Child("CRG");
            child.Put("file", crg.file);
            child.Put("sStart", crg.sStart);
            child.Put("sEnd", crg.sEnd);
            child.Put("orientation", crg.orientation);
            child.Put("mode", crg.mode);
            child.Put("purpose", crg.purpose);
            child.Put("sOffset", crg.sOffset);
            child.Put("tOffset", crg.tOffset);
            child.Put("zOffset", crg.zOffset);
            child.Put("zScale", crg.zScale);
            child.Put("hOffset", crg.hOffset);
        }
        ctx.PutExtra(surface.extra);
    }

    void WriteObjects(WriteContext& ctx, const Objects& objects)
    {
        for (const auto& object : objects.objects)
        {
            auto child = ctx.Child("object");
            child.PutID("id", object.id);
            child.Put("s", object.s);
            child.Put("t", object.t);
            child.Put("zOffset", object.zOffset);
            child.Put("type", object.type);
            child.Put("subtype", object.subtype);
            child.Put("name", object.name);
            child.Put("validLength", object.validLength);
            child.Put("orientation", object.orientation);
            child.Put("length", object.length);
            child.Put("width", object.width);
            child.Put("radius", object.radius);
            child.Put("height", object.height);
            child.Put("hdg", object.hdg);
            child.Put("pitch", object.pitch);
            child.Put("roll", object.roll);
            if (object.dynamic)
            {
                child.PutYesNo("dynamic", *object.dynamic);
            }
            child.Put("perpToRoad", object.perpToRoad);
            WriteObjectChildren(child, object);
            child.PutExtra(object.extra);
        }
        for (const auto& reference : objects.references)
        {
            auto child = ctx.Child("objectReference");
            child.Put("s", reference.s);
            child.Put("t", reference.t);
            child.PutID("id", reference.id);
            child.Put("zOffset", reference.zOffset);
            child.Put("validLength", reference.validLength);
            child.Put("orientation", reference.orientation);
            WriteValidities(child, reference.validities);
        }
        for (const auto& tunnel : objects.tunnels)
        {
            auto child = ctx.Child("tunnel");
            child.Put("s", tunnel.s);
            child.Put("length", tunnel.length);
            child.Put("name", tunnel.name);
            child.PutID("id", tunnel.id);
            child.Put("type", tunnel.type);
            child.Put("lighting", tunnel.lighting);
            child.Put("daylight", tunnel.daylight);
            WriteValidities(child, tunnel.validities);
        }
        for (const auto& bridge : objects.bridges)
        {
            auto child = ctx.Child("bridge");
            child.Put("s", bridge.s);
            child.Put("length", bridge.length);
            child.Put("name", bridge.name);
            child.PutID("id", bridge.id);
            child.Put("type", bridge.type);
            WriteValidities(child, bridge.validities);
        }
        ctx.PutExtra(objects.extra);
    }

    struct PositionWriter
    {
        WriteContext& signal;

        void operator()(const SignalPositionRoad& position) const
        {
            auto child = signal.Child("positionRoad");
            child.PutID("roadId", position.roadId);
            child.Put("s", position.s);
            child.Put("t", position.t);
            child.Put("zOffset", position.zOffset);
            child.Put("hOffset", position.hOffset);
            child.Put("pitch", position.pitch);
            child.Put("roll", position.roll);
        }

        void operator()(const SignalPositionInertial& position) const
        {
            auto child = signal.Child("positionInertial");
            child.Put("x", position.x);
            child.Put("y", position.y);
            child.Put("z", position.z);
            child.Put("hdg", position.hdg);
            child.Put("pitch", position.pitch);
            child.Put("roll", position.roll);
        }
    };

    void WriteSignals(WriteContext& ctx, const Signals& signals)
    {
        for (const auto& signal : signals.signals)
        {
            auto child = ctx.Child("signal");
            child.Put("s", signal.s);
            child.Put("t", signal.t);
            child.PutID("id", signal.id);
            child.Put("name", signal.name);
            child.PutYesNo("dynamic", signal.dynamic);
            child.Put("orientation", signal.orientation);
            child.Put("zOffset", signal.zOffset);
            child.Put("country", signal.country);
            child.Put("countryRevision", signal.countryRevision);
            child.Put("type", signal.type);
            child.Put("subtype", signal.subtype);
            child.Put("value", signal.value);
            child.Put("unit", signal.unit);
            child.Put("height", signal.height);
            child.Put("width", signal.width);
            child.Put("text", signal.text);
            child.Put("hOffset", signal.hOffset);
            child.Put("pitch", signal.pitch);
            child.Put("roll", signal.roll);

            WriteValidities(child, signal.validities);
            for (const auto& dependency : signal.dependencies)
            {
                auto dep = child.Child("dependency");
                dep.PutID("id", dependency.id);
                dep.Put("type", dependency.type);
            }
            for (const auto& reference : signal.references)
            {
                auto ref = child.Child("reference");
                ref.Put("elementType", reference.elementType);
                ref.PutID("elementId", reference.elementId);
                ref.Put("type", reference.type);
            }
            if (signal.position)
            {
                std::visit(PositionWriter{ child }, *signal.position);
            }
            child.PutExtra(signal.extra);
        }
        for (const auto& reference : signals.references)
        {
            auto child = ctx.Child("signalReference");
            child.Put("s", reference.s);
            child.Put("t", reference.t);
            child.PutID("id", reference.id);
            child.Put("orientation", reference.orientation);
            WriteValidities(child, reference.validities);
        }
        ctx.PutExtra(signals.extra);
    }
}

namespace XodrCodec
{
    void WriteRoad(WriteContext& ctx, const Road& road)
    {
        auto violations = CheckRoadStructure(road, ctx.Path());
        if (!violations.empty())
        {
            const auto& v = violations.front();
            throw WriteError(ErrorKind::InvalidStructure, v.path, v.field, v.raw, 0, v.message);
        }

        ctx.Put("name", road.name);
        ctx.Put("length", road.length);
        ctx.PutID("id", road.id);
        ctx.PutID("junction", road.junction);
        ctx.PutUnlessDefault("rule", road.rule, TrafficRule::RHT);

        if (road.link)
        {
            auto link = ctx.Child("link");
            if (road.link->predecessor)
            {
                WriteRoadLinkElement(link.Child("predecessor"), *road.link->predecessor);
            }
            if (road.link->successor)
            {
                WriteRoadLinkElement(link.Child("successor"), *road.link->successor);
            }
            link.PutExtra(road.link->extra);
        }
        for (const auto& type : road.types)
        {
            auto child = ctx.Child("type");
            child.Put("s", type.s);
            child.Put("type", type.type);
            child.Put("country", type.country);
            if (type.speed)
            {
                auto speed = child.Child("speed");
                WriteMaxSpeed(speed, type.speed->max);
                speed.PutUnlessDefault("unit", type.speed->unit, SpeedUnit::MetersPerSecond);
            }
        }

        auto planView = ctx.Child("planView");
        WritePlanView(planView, road.planView);

        if (road.elevationProfile)
        {
            auto profile = ctx.Child("elevationProfile");
            for (const auto& elevation : road.elevationProfile->elevations)
            {
                auto child = profile.Child("elevation");
                WriteCubicRecord(child, elevation);
            }
            profile.PutExtra(road.elevationProfile->extra);
        }
        if (road.lateralProfile)
        {
            auto profile = ctx.Child("lateralProfile");
            for (const auto& superelevation : road.lateralProfile->superelevations)
            {
                auto child = profile.Child("superelevation");
                WriteCubicRecord(child, superelevation);
            }
            for (const auto& shape : road.lateralProfile->shapes)
            {
                auto child = profile.Child("shape");
                child.Put("s", shape.s);
                child.Put("t", shape.t);
                child.Put("a", shape.a);
                child.Put("b", shape.b);
                child.Put("c", shape.c);
                child.Put("d", shape.d);
            }
            profile.PutExtra(road.lateralProfile->extra);
        }

        auto lanes = ctx.Child("lanes");
        WriteLanes(lanes, road.lanes);

        if (road.objects)
        {
            auto objects = ctx.Child("objects");
            WriteObjects(objects, *road.objects);
        }
        if (road.signals)
        {
            auto signals = ctx.Child("signals");
            WriteSignals(signals, *road.signals);
        }
        if (road.surface)
        {
            WriteRoadSurface(ctx.Child("surface"), *road.surface);
        }
        if (road.railroad)
        {
            auto railroad = ctx.Child("railroad");
            WriteRailroad(railroad, *road.railroad);
        }
        ctx.PutExtra(road.extra);
        spdlog::debug("Wrote road {} ({} geometries, {} lane sections)", road.id,
            road.planView.size(), road.lanes.laneSections.size());
    }
}
