#include "reader_detail.h"

namespace
{
    using namespace XodrCodec;

    template <typename Record>
    Record ReadLaneCubic(ReadContext& ctx)
    {
        Record rtn;
        rtn.sOffset = ctx.RequiredLength("sOffset", Domain::NonNegative);
        rtn.a = ctx.RequiredNumber("a");
        rtn.b = ctx.RequiredNumber("b");
        rtn.c = ctx.RequiredNumber("c");
        rtn.d = ctx.RequiredNumber("d");
        return rtn;
    }

    LaneLink ReadLaneLink(ReadContext& ctx)
    {
        LaneLink rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "predecessor"))
            {
                rtn.predecessors.push_back(child.RequiredInt("id"));
                return true;
            }
            if (Is(child, "successor"))
            {
                rtn.successors.push_back(child.RequiredInt("id"));
                return true;
            }
            return false;
        });
        return rtn;
    }

    RoadMarkTypeDetail ReadRoadMarkTypeDetail(ReadContext& ctx)
    {
        RoadMarkTypeDetail rtn;
        rtn.name = ctx.RequiredString("name");
        rtn.width = ctx.RequiredLength("width", Domain::NonNegative);
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "line"))
            {
                return false;
            }
            RoadMarkTypeLine line;
            line.length = child.RequiredLength("length", Domain::NonNegative);
            line.space = child.RequiredLength("space", Domain::NonNegative);
            line.tOffset = child.RequiredLength("tOffset");
            line.sOffset = child.RequiredLength("sOffset", Domain::NonNegative);
            line.rule = child.OptionalEnum<RoadMarkRule>("rule");
            line.width = child.OptionalLength("width", Domain::NonNegative);
            line.color = child.OptionalEnum<RoadMarkColor>("color");
            rtn.lines.push_back(line);
            return true;
        });
        if (rtn.lines.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "line", "", "road mark type requires at least one line");
        }
        return rtn;
    }

    RoadMarkExplicit ReadRoadMarkExplicit(ReadContext& ctx)
    {
        RoadMarkExplicit rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "line"))
            {
                return false;
            }
            ExplicitLine line;
            line.length = child.RequiredLength("length", Domain::NonNegative);
            line.tOffset = child.RequiredLength("tOffset");
            line.sOffset = child.RequiredLength("sOffset", Domain::NonNegative);
            line.rule = child.OptionalEnum<RoadMarkRule>("rule");
            line.width = child.OptionalLength("width", Domain::NonNegative);
            rtn.lines.push_back(line);
            return true;
        });
        if (rtn.lines.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "line", "", "explicit road mark requires at least one line");
        }
        return rtn;
    }

    RoadMark ReadRoadMark(ReadContext& ctx)
    {
        RoadMark rtn;
        rtn.sOffset = ctx.RequiredLength("sOffset", Domain::NonNegative);
        rtn.type = ctx.RequiredEnum<RoadMarkType>("type");
        rtn.weight = ctx.OptionalEnum<RoadMarkWeight>("weight");
        // Exporters such as SUMO leave color out; it reads as "standard" either way
        rtn.color = ctx.DefaultedEnum<RoadMarkColor>("color", RoadMarkColor::Standard);
        rtn.material = ctx.OptionalString("material");
        rtn.width = ctx.OptionalLength("width", Domain::NonNegative);
        rtn.laneChange = ctx.DefaultedEnum<LaneChange>("laneChange", LaneChange::Both);
        rtn.height = ctx.OptionalLength("height");

        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "sway"))
            {
                RoadMarkSway sway;
                sway.ds = child.RequiredLength("ds", Domain::NonNegative);
                sway.a = child.RequiredNumber("a");
                sway.b = child.RequiredNumber("b");
                sway.c = child.RequiredNumber("c");
                sway.d = child.RequiredNumber("d");
                rtn.sways.push_back(sway);
                return true;
            }
            if (Is(child, "type"))
            {
                if (ctx.FirstOccurrence(child, rtn.typeDetail.has_value()))
                {
                    rtn.typeDetail = ReadRoadMarkTypeDetail(child);
                }
                return true;
            }
            if (Is(child, "explicit"))
            {
                if (ctx.FirstOccurrence(child, rtn.explicitLines.has_value()))
                {
                    rtn.explicitLines = ReadRoadMarkExplicit(child);
                }
                return true;
            }
            return false;
        }, &rtn.extra);
        return rtn;
    }

    Lane ReadLane(ReadContext& ctx)
    {
        Lane rtn;
        rtn.id = ctx.RequiredInt("id");
        rtn.type = ctx.RequiredEnum<LaneType>("type");
        rtn.level = ctx.DefaultedBool("level", false);

        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "link"))
            {
                if (ctx.FirstOccurrence(child, rtn.link.has_value()))
                {
                    rtn.link = ReadLaneLink(child);
                }
            }
            else if (Is(child, "width"))
            {
                rtn.shape.push_back(ReadLaneCubic<LaneWidth>(child));
            }
            else if (Is(child, "border"))
            {
                rtn.shape.push_back(ReadLaneCubic<LaneBorder>(child));
            }
            else if (Is(child, "roadMark"))
            {
                rtn.roadMarks.push_back(ReadRoadMark(child));
            }
            else if (Is(child, "material"))
            {
                LaneMaterial material;
                material.sOffset = child.RequiredLength("sOffset", Domain::NonNegative);
                material.surface = child.OptionalString("surface");
                material.friction = child.RequiredNumber("friction", Domain::NonNegative);
                material.roughness = child.OptionalNumber("roughness", Domain::NonNegative);
                rtn.materials.push_back(material);
            }
            else if (Is(child, "speed"))
            {
                LaneSpeed speed;
                speed.sOffset = child.RequiredLength("sOffset", Domain::NonNegative);
                speed.max = child.RequiredNumber("max", Domain::NonNegative);
                speed.unit = child.DefaultedEnum<SpeedUnit>("unit", SpeedUnit::MetersPerSecond);
                rtn.speeds.push_back(speed);
            }
            else if (Is(child, "access"))
            {
                LaneAccess access;
                access.sOffset = child.RequiredLength("sOffset", Domain::NonNegative);
                access.rule = child.OptionalEnum<AccessRule>("rule");
                access.restriction = child.RequiredEnum<AccessRestriction>("restriction");
                rtn.accesses.push_back(access);
            }
            else if (Is(child, "height"))
            {
                LaneHeight height;
                height.sOffset = child.RequiredLength("sOffset", Domain::NonNegative);
                height.inner = child.OptionalLength("inner");
                height.outer = child.OptionalLength("outer");
                rtn.heights.push_back(height);
            }
            else if (Is(child, "rule"))
            {
                LaneRule rule;
                rule.sOffset = child.RequiredLength("sOffset", Domain::NonNegative);
                rule.value = child.RequiredString("value");
                rtn.rules.push_back(rule);
            }
            else
            {
                return false;
            }
            return true;
        }, &rtn.extra);
        return rtn;
    }

    std::vector<Lane> ReadLaneGroup(ReadContext& ctx)
    {
        std::vector<Lane> rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "lane"))
            {
                return false;
            }
            rtn.push_back(ReadLane(child));
            return true;
        });
        return rtn;
    }

    LaneSection ReadLaneSection(ReadContext& ctx)
    {
        LaneSection rtn;
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.singleSide = ctx.DefaultedBool("singleSide", false);

        bool leftSeen = false, centerSeen = false, rightSeen = false;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "left"))
            {
                if (ctx.FirstOccurrence(child, leftSeen))
                {
                    leftSeen = true;
                    rtn.left = ReadLaneGroup(child);
                }
            }
            else if (Is(child, "center"))
            {
                if (ctx.FirstOccurrence(child, centerSeen))
                {
                    centerSeen = true;
                    auto lanes = ReadLaneGroup(child);
                    if (lanes.empty())
                    {
                        child.Fail(ErrorKind::MissingRequiredField, "lane", "", "center requires exactly one lane");
                    }
                    if (lanes.size() > 1)
                    {
                        child.Fail(ErrorKind::InvalidStructure, "lane", std::to_string(lanes.size()),
                            "center requires exactly one lane");
                    }
                    rtn.center = std::move(lanes.front());
                }
            }
            else if (Is(child, "right"))
            {
                if (ctx.FirstOccurrence(child, rightSeen))
                {
                    rightSeen = true;
                    rtn.right = ReadLaneGroup(child);
                }
            }
            else
            {
                return false;
            }
            return true;
        }, &rtn.extra);

        if (!centerSeen)
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "center", "");
        }
        return rtn;
    }
}

namespace XodrCodec
{
    Lanes ReadLanes(ReadContext& ctx)
    {
        Lanes rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "laneOffset"))
            {
                rtn.laneOffsets.push_back(ReadCubicRecord(child));
                return true;
            }
            if (Is(child, "laneSection"))
            {
                rtn.laneSections.push_back(ReadLaneSection(child));
                return true;
            }
            return false;
        }, &rtn.extra);

        if (rtn.laneSections.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "laneSection", "", "lanes require at least one lane section");
        }
        return rtn;
    }
}
