#include "writer_detail.h"

namespace
{
    using namespace XodrCodec;

    template <typename Record>
    void WriteLaneCubic(WriteContext ctx, const Record& record)
    {
        ctx.Put("sOffset", record.sOffset);
        ctx.Put("a", record.a);
        ctx.Put("b", record.b);
        ctx.Put("c", record.c);
        ctx.Put("d", record.d);
    }

    struct LaneShapeWriter
    {
        WriteContext& lane;

        void operator()(const LaneWidth& width) const { WriteLaneCubic(lane.Child("width"), width); }
        void operator()(const LaneBorder& border) const { WriteLaneCubic(lane.Child("border"), border); }
    };

    void WriteRoadMark(WriteContext& ctx, const RoadMark& mark)
    {
        ctx.Put("sOffset", mark.sOffset);
        ctx.Put("type", mark.type);
        ctx.Put("weight", mark.weight);
        if (ctx.GetWorkarounds().IsEnabled(Workaround::SumoRoadMarkMissingColor))
        {
            ctx.Put("color", mark.color);
        }
        else
        {
            ctx.PutUnlessDefault("color", mark.color, RoadMarkColor::Standard);
        }
        ctx.Put("material", mark.material);
        ctx.Put("width", mark.width);
        ctx.PutUnlessDefault("laneChange", mark.laneChange, LaneChange::Both);
        ctx.Put("height", mark.height);

        for (const auto& sway : mark.sways)
        {
            auto child = ctx.Child("sway");
            child.Put("ds", sway.ds);
            child.Put("a", sway.a);
            child.Put("b", sway.b);
            child.Put("c", sway.c);
            child.Put("d", sway.d);
        }
        if (mark.typeDetail)
        {
            auto type = ctx.Child("type");
            type.Put("name", mark.typeDetail->name);
            type.Put("width", mark.typeDetail->width);
            type.RequireNonEmpty(mark.typeDetail->lines, "line");
            for (const auto& line : mark.typeDetail->lines)
            {
                auto child = type.Child("line");
                child.Put("length", line.length);
                child.Put("space", line.space);
                child.Put("tOffset", line.tOffset);
                child.Put("sOffset", line.sOffset);
                child.Put("rule", line.rule);
                child.Put("width", line.width);
                child.Put("color", line.color);
            }
        }
        if (mark.explicitLines)
        {
            auto explicitLines = ctx.Child("explicit");
            explicitLines.RequireNonEmpty(mark.explicitLines->lines, "line");
            for (const auto& line : mark.explicitLines->lines)
            {
                auto child = explicitLines.Child("line");
                child.Put("length", line.length);
                child.Put("tOffset", line.tOffset);
                child.Put("sOffset", line.sOffset);
                child.Put("rule", line.rule);
                child.Put("width", line.width);
            }
        }
        ctx.PutExtra(mark.extra);
    }

    void WriteLane(WriteContext& ctx, const Lane& lane)
    {
        ctx.Put("id", lane.id);
        ctx.Put("type", lane.type);
        ctx.PutUnlessDefault("level", lane.level, false);

        if (lane.link)
        {
            auto link = ctx.Child("link");
            for (int id : lane.link->predecessors)
            {
                link.Child("predecessor").Put("id", id);
            }
            for (int id : lane.link->successors)
            {
                link.Child("successor").Put("id", id);
            }
        }
        for (const auto& record : lane.shape)
        {
            std::visit(LaneShapeWriter{ ctx }, record);
        }
        for (const auto& mark : lane.roadMarks)
        {
            auto child = ctx.Child("roadMark");
            WriteRoadMark(child, mark);
        }
        for (const auto& material : lane.materials)
        {
            auto child = ctx.Child("material");
            child.Put("sOffset", material.sOffset);
            child.Put("surface", material.surface);
            child.Put("friction", material.friction);
            child.Put("roughness", material.roughness);
        }
        for (const auto& speed : lane.speeds)
        {
            auto child = ctx.Child("speed");
            child.Put("sOffset", speed.sOffset);
            child.Put("max", speed.max);
            child.PutUnlessDefault("unit", speed.unit, SpeedUnit::MetersPerSecond);
        }
        for (const auto& access : lane.accesses)
        {
            auto child = ctx.Child("access");
            child.Put("sOffset", access.sOffset);
            child.Put("rule", access.rule);
            child.Put("restriction", access.restriction);
        }
        for (const auto& height : lane.heights)
        {
            auto child = ctx.Child("height");
            child.Put("sOffset", height.sOffset);
            child.Put("inner", height.inner);
            child.Put("outer", height.outer);
        }
        for (const auto& rule : lane.rules)
        {
            auto child = ctx.Child("rule");
            child.Put("sOffset", rule.sOffset);
            child.Put("value", rule.value);
        }
        ctx.PutExtra(lane.extra);
    }

    void WriteLaneGroup(WriteContext ctx, const std::vector<Lane>& lanes)
    {
        for (const auto& lane : lanes)
        {
            auto child = ctx.Child("lane");
            WriteLane(child, lane);
        }
    }

    void WriteLaneSection(WriteContext& ctx, const LaneSection& section)
    {
        ctx.Put("s", section.s);
        ctx.PutUnlessDefault("singleSide", section.singleSide, false);
        if (!section.left.empty())
        {
            WriteLaneGroup(ctx.Child("left"), section.left);
        }
        auto center = ctx.Child("center").Child("lane");
        WriteLane(center, section.center);
        if (!section.right.empty())
        {
            WriteLaneGroup(ctx.Child("right"), section.right);
        }
        ctx.PutExtra(section.extra);
    }
}

namespace XodrCodec
{
    void WriteLanes(WriteContext& ctx, const Lanes& lanes)
    {
        for (const auto& offset : lanes.laneOffsets)
        {
            auto child = ctx.Child("laneOffset");
            WriteCubicRecord(child, offset);
        }
        ctx.RequireNonEmpty(lanes.laneSections, "laneSection");
        for (const auto& section : lanes.laneSections)
        {
            auto child = ctx.Child("laneSection");
            WriteLaneSection(child, section);
        }
        ctx.PutExtra(lanes.extra);
    }
}
