#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "units.h"
#include "enums.h"
#include "geometry.h"
#include "lane.h"
#include "object.h"
#include "signal.h"
#include "railroad.h"
#include "additional_data.h"

namespace XodrCodec
{
    struct RoadLinkElement
    {
        ElementType elementType = ElementType::Road;
        std::string elementId;
        std::optional<ContactPoint> contactPoint;
        std::optional<Length> elementS;
        std::optional<ElementDir> elementDir;

        bool operator==(const RoadLinkElement& o) const
        {
            return std::tie(elementType, elementId, contactPoint, elementS, elementDir) ==
                std::tie(o.elementType, o.elementId, o.contactPoint, o.elementS, o.elementDir);
        }
        bool operator!=(const RoadLinkElement& o) const { return !(*this == o); }
    };

    struct RoadLink
    {
        std::optional<RoadLinkElement> predecessor;
        std::optional<RoadLinkElement> successor;
        AdditionalData extra;

        bool operator==(const RoadLink& o) const
        {
            return std::tie(predecessor, successor, extra) == std::tie(o.predecessor, o.successor, o.extra);
        }
        bool operator!=(const RoadLink& o) const { return !(*this == o); }
    };

    enum class SpeedLimitKind
    {
        Limit,
        NoLimit,
        Undefined
    };

    // @max of a road type speed: number, "no limit" or "undefined"
    struct MaxSpeed
    {
        SpeedLimitKind kind = SpeedLimitKind::Undefined;
        double value = 0;  // meaningful for Limit only

        static MaxSpeed Limit(double v) { return MaxSpeed{ SpeedLimitKind::Limit, v }; }
        static MaxSpeed NoLimit() { return MaxSpeed{ SpeedLimitKind::NoLimit, 0 }; }
        static MaxSpeed Undefined() { return MaxSpeed{ SpeedLimitKind::Undefined, 0 }; }

        bool operator==(const MaxSpeed& o) const
        {
            return kind == o.kind && (kind != SpeedLimitKind::Limit || value == o.value);
        }
        bool operator!=(const MaxSpeed& o) const { return !(*this == o); }
    };

    struct RoadSpeed
    {
        MaxSpeed max;
        SpeedUnit unit = SpeedUnit::MetersPerSecond;

        bool operator==(const RoadSpeed& o) const { return max == o.max && unit == o.unit; }
        bool operator!=(const RoadSpeed& o) const { return !(*this == o); }
    };

    struct RoadTypeRecord
    {
        Length s;
        RoadType type = RoadType::Unknown;
        std::optional<std::string> country;
        std::optional<RoadSpeed> speed;

        bool operator==(const RoadTypeRecord& o) const
        {
            return std::tie(s, type, country, speed) == std::tie(o.s, o.type, o.country, o.speed);
        }
        bool operator!=(const RoadTypeRecord& o) const { return !(*this == o); }
    };

    struct ElevationProfile
    {
        std::vector<CubicRecord> elevations;
        AdditionalData extra;

        bool operator==(const ElevationProfile& o) const
        {
            return std::tie(elevations, extra) == std::tie(o.elevations, o.extra);
        }
        bool operator!=(const ElevationProfile& o) const { return !(*this == o); }
    };

    // Cross-section height over t, anchored at (s, t)
    struct LateralShape
    {
        Length s;
        Length t;
        double a = 0, b = 0, c = 0, d = 0;

        bool operator==(const LateralShape& o) const
        {
            return std::tie(s, t, a, b, c, d) == std::tie(o.s, o.t, o.a, o.b, o.c, o.d);
        }
        bool operator!=(const LateralShape& o) const { return !(*this == o); }
    };

    struct LateralProfile
    {
        std::vector<CubicRecord> superelevations;
        std::vector<LateralShape> shapes;
        AdditionalData extra;

        bool operator==(const LateralProfile& o) const
        {
            return std::tie(superelevations, shapes, extra) == std::tie(o.superelevations, o.shapes, o.extra);
        }
        bool operator!=(const LateralProfile& o) const { return !(*this == o); }
    };

    // OpenCRG surface data applied along the road
    struct RoadCrg
    {
        std::string file;
        Length sStart;
        Length sEnd;
        CrgOrientation orientation = CrgOrientation::Same;
        RoadCrgMode mode = RoadCrgMode::Attached;
        std::optional<CrgPurpose> purpose;
        std::optional<Length> sOffset;
        std::optional<Length> tOffset;
        std::optional<Length> zOffset;
        std::optional<double> zScale;
        std::optional<Angle> hOffset;

        bool operator==(const RoadCrg& o) const
        {
            return std::tie(file, sStart, sEnd, orientation, mode, purpose, sOffset, tOffset, zOffset, zScale, hOffset) ==
                std::tie(o.file, o.sStart, o.sEnd, o.orientation, o.mode, o.purpose, o.sOffset, o.tOffset,
                    o.zOffset, o.zScale, o.hOffset);
        }
        bool operator!=(const RoadCrg& o) const { return !(*this == o); }
    };

    struct RoadSurface
    {
        std::vector<RoadCrg> crgs;
        AdditionalData extra;

        bool operator==(const RoadSurface& o) const
        {
            return std::tie(crgs, extra) == std::tie(o.crgs, o.extra);
        }
        bool operator!=(const RoadSurface& o) const { return !(*this == o); }
    };

    /*Roads refer to junctions / other roads by id only; resolve with Document::Find*.
    * junction is "-1" for roads outside any junction.
    */
    struct Road
    {
        std::string id;
        std::optional<std::string> name;
        Length length;
        std::string junction = "-1";
        TrafficRule rule = TrafficRule::RHT;
        std::optional<RoadLink> link;
        std::vector<RoadTypeRecord> types;
        std::vector<Geometry> planView;  // at least one, s-ordered
        std::optional<ElevationProfile> elevationProfile;
        std::optional<LateralProfile> lateralProfile;
        Lanes lanes;
        std::optional<Objects> objects;
        std::optional<Signals> signals;
        std::optional<RoadSurface> surface;
        std::optional<Railroad> railroad;
        AdditionalData extra;

        bool InJunction() const { return junction != "-1"; }

        // Segment covering s; the later one wins at a shared boundary
        const Geometry& GeometryAt(Length s) const;

        /*Reference line pose at s.
        * Throws GeometryError (OffsetOutOfRange) unless 0 <= s <= length
        */
        Pose Evaluate(Length s) const;

        bool operator==(const Road& o) const
        {
            return std::tie(id, name, length, junction, rule, link, types, planView, elevationProfile,
                lateralProfile, lanes, objects, signals, surface, railroad, extra) ==
                std::tie(o.id, o.name, o.length, o.junction, o.rule, o.link, o.types, o.planView,
                    o.elevationProfile, o.lateralProfile, o.lanes, o.objects, o.signals, o.surface,
                    o.railroad, o.extra);
        }
        bool operator!=(const Road& o) const { return !(*this == o); }
    };
}
