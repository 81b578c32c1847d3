#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "units.h"
#include "enums.h"
#include "additional_data.h"

namespace XodrCodec
{
    // Lane range an object / signal applies to
    struct LaneValidity
    {
        int fromLane = 0;
        int toLane = 0;

        bool operator==(const LaneValidity& o) const
        {
            return fromLane == o.fromLane && toLane == o.toLane;
        }
        bool operator!=(const LaneValidity& o) const { return !(*this == o); }
    };

    // Cubic over ds from the record start: value = a + b*ds + c*ds^2 + d*ds^3
    struct LaneWidth
    {
        Length sOffset;
        double a = 0, b = 0, c = 0, d = 0;

        bool operator==(const LaneWidth& o) const
        {
            return std::tie(sOffset, a, b, c, d) == std::tie(o.sOffset, o.a, o.b, o.c, o.d);
        }
        bool operator!=(const LaneWidth& o) const { return !(*this == o); }
    };

    struct LaneBorder
    {
        Length sOffset;
        double a = 0, b = 0, c = 0, d = 0;

        bool operator==(const LaneBorder& o) const
        {
            return std::tie(sOffset, a, b, c, d) == std::tie(o.sOffset, o.a, o.b, o.c, o.d);
        }
        bool operator!=(const LaneBorder& o) const { return !(*this == o); }
    };

    // width and border records may interleave; document order is kept
    using LaneShapeRecord = std::variant<LaneWidth, LaneBorder>;

    struct RoadMarkSway
    {
        Length ds;
        double a = 0, b = 0, c = 0, d = 0;

        bool operator==(const RoadMarkSway& o) const
        {
            return std::tie(ds, a, b, c, d) == std::tie(o.ds, o.a, o.b, o.c, o.d);
        }
        bool operator!=(const RoadMarkSway& o) const { return !(*this == o); }
    };

    struct RoadMarkTypeLine
    {
        Length length;
        Length space;
        Length tOffset;
        Length sOffset;
        std::optional<RoadMarkRule> rule;
        std::optional<Length> width;
        std::optional<RoadMarkColor> color;

        bool operator==(const RoadMarkTypeLine& o) const
        {
            return std::tie(length, space, tOffset, sOffset, rule, width, color) ==
                std::tie(o.length, o.space, o.tOffset, o.sOffset, o.rule, o.width, o.color);
        }
        bool operator!=(const RoadMarkTypeLine& o) const { return !(*this == o); }
    };

    struct RoadMarkTypeDetail
    {
        std::string name;
        Length width;
        std::vector<RoadMarkTypeLine> lines;  // at least one

        bool operator==(const RoadMarkTypeDetail& o) const
        {
            return std::tie(name, width, lines) == std::tie(o.name, o.width, o.lines);
        }
        bool operator!=(const RoadMarkTypeDetail& o) const { return !(*this == o); }
    };

    struct ExplicitLine
    {
        Length length;
        Length tOffset;
        Length sOffset;
        std::optional<RoadMarkRule> rule;
        std::optional<Length> width;

        bool operator==(const ExplicitLine& o) const
        {
            return std::tie(length, tOffset, sOffset, rule, width) ==
                std::tie(o.length, o.tOffset, o.sOffset, o.rule, o.width);
        }
        bool operator!=(const ExplicitLine& o) const { return !(*this == o); }
    };

    struct RoadMarkExplicit
    {
        std::vector<ExplicitLine> lines;  // at least one

        bool operator==(const RoadMarkExplicit& o) const { return lines == o.lines; }
        bool operator!=(const RoadMarkExplicit& o) const { return !(*this == o); }
    };

    struct RoadMark
    {
        Length sOffset;
        RoadMarkType type = RoadMarkType::Solid;
        std::optional<RoadMarkWeight> weight;
        RoadMarkColor color = RoadMarkColor::Standard;
        std::optional<std::string> material;
        std::optional<Length> width;
        LaneChange laneChange = LaneChange::Both;
        std::optional<Length> height;
        std::vector<RoadMarkSway> sways;
        std::optional<RoadMarkTypeDetail> typeDetail;
        std::optional<RoadMarkExplicit> explicitLines;
        AdditionalData extra;

        bool operator==(const RoadMark& o) const
        {
            return std::tie(sOffset, type, weight, color, material, width, laneChange, height,
                sways, typeDetail, explicitLines, extra) ==
                std::tie(o.sOffset, o.type, o.weight, o.color, o.material, o.width, o.laneChange, o.height,
                    o.sways, o.typeDetail, o.explicitLines, o.extra);
        }
        bool operator!=(const RoadMark& o) const { return !(*this == o); }
    };

    struct LaneMaterial
    {
        Length sOffset;
        double friction = 0;
        std::optional<double> roughness;
        std::optional<std::string> surface;

        bool operator==(const LaneMaterial& o) const
        {
            return std::tie(sOffset, friction, roughness, surface) ==
                std::tie(o.sOffset, o.friction, o.roughness, o.surface);
        }
        bool operator!=(const LaneMaterial& o) const { return !(*this == o); }
    };

    struct LaneSpeed
    {
        Length sOffset;
        double max = 0;
        SpeedUnit unit = SpeedUnit::MetersPerSecond;

        bool operator==(const LaneSpeed& o) const
        {
            return std::tie(sOffset, max, unit) == std::tie(o.sOffset, o.max, o.unit);
        }
        bool operator!=(const LaneSpeed& o) const { return !(*this == o); }
    };

    struct LaneAccess
    {
        Length sOffset;
        AccessRestriction restriction = AccessRestriction::None;
        std::optional<AccessRule> rule;

        bool operator==(const LaneAccess& o) const
        {
            return std::tie(sOffset, restriction, rule) == std::tie(o.sOffset, o.restriction, o.rule);
        }
        bool operator!=(const LaneAccess& o) const { return !(*this == o); }
    };

    struct LaneHeight
    {
        Length sOffset;
        std::optional<Length> inner;
        std::optional<Length> outer;

        bool operator==(const LaneHeight& o) const
        {
            return std::tie(sOffset, inner, outer) == std::tie(o.sOffset, o.inner, o.outer);
        }
        bool operator!=(const LaneHeight& o) const { return !(*this == o); }
    };

    struct LaneRule
    {
        Length sOffset;
        std::string value;

        bool operator==(const LaneRule& o) const
        {
            return std::tie(sOffset, value) == std::tie(o.sOffset, o.value);
        }
        bool operator!=(const LaneRule& o) const { return !(*this == o); }
    };

    // Lane ids in the neighbouring lane sections / roads
    struct LaneLink
    {
        std::vector<int> predecessors;
        std::vector<int> successors;

        bool operator==(const LaneLink& o) const
        {
            return std::tie(predecessors, successors) == std::tie(o.predecessors, o.successors);
        }
        bool operator!=(const LaneLink& o) const { return !(*this == o); }
    };

    struct Lane
    {
        int id = 0;
        LaneType type = LaneType::Driving;
        bool level = false;
        std::optional<LaneLink> link;
        std::vector<LaneShapeRecord> shape;
        std::vector<RoadMark> roadMarks;
        std::vector<LaneMaterial> materials;
        std::vector<LaneSpeed> speeds;
        std::vector<LaneAccess> accesses;
        std::vector<LaneHeight> heights;
        std::vector<LaneRule> rules;
        AdditionalData extra;

        bool operator==(const Lane& o) const
        {
            return std::tie(id, type, level, link, shape, roadMarks, materials, speeds, accesses,
                heights, rules, extra) ==
                std::tie(o.id, o.type, o.level, o.link, o.shape, o.roadMarks, o.materials, o.speeds, o.accesses,
                    o.heights, o.rules, o.extra);
        }
        bool operator!=(const Lane& o) const { return !(*this == o); }
    };

    /*Lane layout over [s, next section s).
    * left ids are 1..n, right ids are -1..-n (any order), center id is 0.
    */
    struct LaneSection
    {
        Length s;
        bool singleSide = false;
        std::vector<Lane> left;
        Lane center;
        std::vector<Lane> right;
        AdditionalData extra;

        bool operator==(const LaneSection& o) const
        {
            return std::tie(s, singleSide, left, center, right, extra) ==
                std::tie(o.s, o.singleSide, o.left, o.center, o.right, o.extra);
        }
        bool operator!=(const LaneSection& o) const { return !(*this == o); }
    };

    // Cubic record anchored at an absolute s (laneOffset, elevation, superelevation)
    struct CubicRecord
    {
        Length s;
        double a = 0, b = 0, c = 0, d = 0;

        bool operator==(const CubicRecord& o) const
        {
            return std::tie(s, a, b, c, d) == std::tie(o.s, o.a, o.b, o.c, o.d);
        }
        bool operator!=(const CubicRecord& o) const { return !(*this == o); }
    };

    struct Lanes
    {
        std::vector<CubicRecord> laneOffsets;
        std::vector<LaneSection> laneSections;  // at least one
        AdditionalData extra;

        bool operator==(const Lanes& o) const
        {
            return std::tie(laneOffsets, laneSections, extra) ==
                std::tie(o.laneOffsets, o.laneSections, o.extra);
        }
        bool operator!=(const Lanes& o) const { return !(*this == o); }
    };
}
