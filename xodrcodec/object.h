#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "units.h"
#include "enums.h"
#include "lane.h"
#include "additional_data.h"

namespace XodrCodec
{
    struct ObjectRepeat
    {
        Length s;
        Length length;
        Length distance;
        Length tStart;
        Length tEnd;
        Length heightStart;
        Length heightEnd;
        Length zOffsetStart;
        Length zOffsetEnd;
        std::optional<Length> widthStart;
        std::optional<Length> widthEnd;
        std::optional<Length> lengthStart;
        std::optional<Length> lengthEnd;
        std::optional<Length> radiusStart;
        std::optional<Length> radiusEnd;

        bool operator==(const ObjectRepeat& o) const
        {
            return std::tie(s, length, distance, tStart, tEnd, heightStart, heightEnd, zOffsetStart, zOffsetEnd,
                widthStart, widthEnd, lengthStart, lengthEnd, radiusStart, radiusEnd) ==
                std::tie(o.s, o.length, o.distance, o.tStart, o.tEnd, o.heightStart, o.heightEnd,
                    o.zOffsetStart, o.zOffsetEnd, o.widthStart, o.widthEnd, o.lengthStart, o.lengthEnd,
                    o.radiusStart, o.radiusEnd);
        }
        bool operator!=(const ObjectRepeat& o) const { return !(*this == o); }
    };

    // Outline corner in road coordinates
    struct CornerRoad
    {
        Length s;
        Length t;
        Length dz;
        Length height;
        std::optional<unsigned> id;

        bool operator==(const CornerRoad& o) const
        {
            return std::tie(s, t, dz, height, id) == std::tie(o.s, o.t, o.dz, o.height, o.id);
        }
        bool operator!=(const CornerRoad& o) const { return !(*this == o); }
    };

    // Outline corner in the object's local u/v/z frame
    struct CornerLocal
    {
        Length u;
        Length v;
        Length z;
        Length height;
        std::optional<unsigned> id;

        bool operator==(const CornerLocal& o) const
        {
            return std::tie(u, v, z, height, id) == std::tie(o.u, o.v, o.z, o.height, o.id);
        }
        bool operator!=(const CornerLocal& o) const { return !(*this == o); }
    };

    using OutlineCorner = std::variant<CornerRoad, CornerLocal>;

    struct Outline
    {
        std::optional<unsigned> id;
        std::optional<OutlineFillType> fillType;
        std::optional<bool> outer;
        std::optional<bool> closed;
        std::optional<LaneType> laneType;
        std::vector<OutlineCorner> corners;  // at least one, document order
        AdditionalData extra;

        bool operator==(const Outline& o) const
        {
            return std::tie(id, fillType, outer, closed, laneType, corners, extra) ==
                std::tie(o.id, o.fillType, o.outer, o.closed, o.laneType, o.corners, o.extra);
        }
        bool operator!=(const Outline& o) const { return !(*this == o); }
    };

    struct Outlines
    {
        std::vector<Outline> outlines;  // at least one
        AdditionalData extra;

        bool operator==(const Outlines& o) const
        {
            return std::tie(outlines, extra) == std::tie(o.outlines, o.extra);
        }
        bool operator!=(const Outlines& o) const { return !(*this == o); }
    };

    struct ObjectMaterial
    {
        std::optional<std::string> surface;
        std::optional<double> friction;
        std::optional<double> roughness;

        bool operator==(const ObjectMaterial& o) const
        {
            return std::tie(surface, friction, roughness) == std::tie(o.surface, o.friction, o.roughness);
        }
        bool operator!=(const ObjectMaterial& o) const { return !(*this == o); }
    };

    struct ParkingSpace
    {
        ParkingAccess access = ParkingAccess::All;
        std::optional<std::string> restrictions;

        bool operator==(const ParkingSpace& o) const
        {
            return std::tie(access, restrictions) == std::tie(o.access, o.restrictions);
        }
        bool operator!=(const ParkingSpace& o) const { return !(*this == o); }
    };

    /*Painted line along an outline edge. Without corner references it follows
    * the object's side given by @side.
    */
    struct ObjectMarking
    {
        std::optional<MarkingSide> side;
        std::optional<RoadMarkWeight> weight;
        std::optional<Length> width;
        RoadMarkColor color = RoadMarkColor::Standard;
        std::optional<Length> zOffset;
        Length spaceLength;
        Length lineLength;
        Length startOffset;
        Length stopOffset;
        std::vector<unsigned> cornerReferences;
        AdditionalData extra;

        bool operator==(const ObjectMarking& o) const
        {
            return std::tie(side, weight, width, color, zOffset, spaceLength, lineLength, startOffset,
                stopOffset, cornerReferences, extra) ==
                std::tie(o.side, o.weight, o.width, o.color, o.zOffset, o.spaceLength, o.lineLength,
                    o.startOffset, o.stopOffset, o.cornerReferences, o.extra);
        }
        bool operator!=(const ObjectMarking& o) const { return !(*this == o); }
    };

    struct ObjectMarkings
    {
        std::vector<ObjectMarking> markings;  // at least one
        AdditionalData extra;

        bool operator==(const ObjectMarkings& o) const
        {
            return std::tie(markings, extra) == std::tie(o.markings, o.extra);
        }
        bool operator!=(const ObjectMarkings& o) const { return !(*this == o); }
    };

    struct ObjectBorder
    {
        Length width;
        ObjectBorderType type = ObjectBorderType::Concrete;
        unsigned outlineId = 0;
        std::optional<bool> useCompleteOutline;
        std::vector<unsigned> cornerReferences;
        AdditionalData extra;

        bool operator==(const ObjectBorder& o) const
        {
            return std::tie(width, type, outlineId, useCompleteOutline, cornerReferences, extra) ==
                std::tie(o.width, o.type, o.outlineId, o.useCompleteOutline, o.cornerReferences, o.extra);
        }
        bool operator!=(const ObjectBorder& o) const { return !(*this == o); }
    };

    struct ObjectBorders
    {
        std::vector<ObjectBorder> borders;  // at least one
        AdditionalData extra;

        bool operator==(const ObjectBorders& o) const
        {
            return std::tie(borders, extra) == std::tie(o.borders, o.extra);
        }
        bool operator!=(const ObjectBorders& o) const { return !(*this == o); }
    };

    struct ObjectCrg
    {
        std::optional<std::string> file;
        std::optional<bool> hideRoadSurfaceCRG;
        std::optional<double> zScale;

        bool operator==(const ObjectCrg& o) const
        {
            return std::tie(file, hideRoadSurfaceCRG, zScale) == std::tie(o.file, o.hideRoadSurfaceCRG, o.zScale);
        }
        bool operator!=(const ObjectCrg& o) const { return !(*this == o); }
    };

    struct ObjectSurface
    {
        std::optional<ObjectCrg> crg;
        AdditionalData extra;

        bool operator==(const ObjectSurface& o) const
        {
            return std::tie(crg, extra) == std::tie(o.crg, o.extra);
        }
        bool operator!=(const ObjectSurface& o) const { return !(*this == o); }
    };

    struct RoadObject
    {
        std::string id;
        Length s;
        Length t;
        Length zOffset;
        std::optional<ObjectType> type;
        std::optional<std::string> subtype;
        std::optional<std::string> name;
        std::optional<Length> validLength;
        std::optional<Orientation> orientation;
        std::optional<Length> length;
        std::optional<Length> width;
        std::optional<Length> radius;
        std::optional<Length> height;
        std::optional<Angle> hdg;
        std::optional<Angle> pitch;
        std::optional<Angle> roll;
        std::optional<bool> dynamic;     // yes / no
        std::optional<bool> perpToRoad;  // true / false
        std::vector<ObjectRepeat> repeats;
        std::optional<Outline> outline;  // 1.4 style single outline
        std::optional<Outlines> outlines;
        std::vector<ObjectMaterial> materials;
        std::vector<LaneValidity> validities;
        std::optional<ParkingSpace> parkingSpace;
        std::optional<ObjectMarkings> markings;
        std::optional<ObjectBorders> borders;
        std::optional<ObjectSurface> surface;
        AdditionalData extra;

        bool operator==(const RoadObject& o) const
        {
            return std::tie(id, s, t, zOffset, type, subtype, name, validLength, orientation, length, width,
                radius, height, hdg, pitch, roll, dynamic, perpToRoad, repeats, outline, outlines, materials,
                validities, parkingSpace, markings, borders, surface, extra) ==
                std::tie(o.id, o.s, o.t, o.zOffset, o.type, o.subtype, o.name, o.validLength, o.orientation,
                    o.length, o.width, o.radius, o.height, o.hdg, o.pitch, o.roll, o.dynamic, o.perpToRoad,
                    o.repeats, o.outline, o.outlines, o.materials, o.validities, o.parkingSpace, o.markings,
                    o.borders, o.surface, o.extra);
        }
        bool operator!=(const RoadObject& o) const { return !(*this == o); }
    };

    // Reuse of an object defined on another road
    struct ObjectReference
    {
        std::string id;
        Length s;
        Length t;
        std::optional<Length> zOffset;
        std::optional<Length> validLength;
        Orientation orientation = Orientation::None;
        std::vector<LaneValidity> validities;

        bool operator==(const ObjectReference& o) const
        {
            return std::tie(id, s, t, zOffset, validLength, orientation, validities) ==
                std::tie(o.id, o.s, o.t, o.zOffset, o.validLength, o.orientation, o.validities);
        }
        bool operator!=(const ObjectReference& o) const { return !(*this == o); }
    };

    struct Tunnel
    {
        std::string id;
        Length s;
        Length length;
        std::optional<std::string> name;
        TunnelType type = TunnelType::Standard;
        std::optional<double> lighting;
        std::optional<double> daylight;
        std::vector<LaneValidity> validities;

        bool operator==(const Tunnel& o) const
        {
            return std::tie(id, s, length, name, type, lighting, daylight, validities) ==
                std::tie(o.id, o.s, o.length, o.name, o.type, o.lighting, o.daylight, o.validities);
        }
        bool operator!=(const Tunnel& o) const { return !(*this == o); }
    };

    struct Bridge
    {
        std::string id;
        Length s;
        Length length;
        std::optional<std::string> name;
        BridgeType type = BridgeType::Concrete;
        std::vector<LaneValidity> validities;

        bool operator==(const Bridge& o) const
        {
            return std::tie(id, s, length, name, type, validities) ==
                std::tie(o.id, o.s, o.length, o.name, o.type, o.validities);
        }
        bool operator!=(const Bridge& o) const { return !(*this == o); }
    };

    struct Objects
    {
        std::vector<RoadObject> objects;
        std::vector<ObjectReference> references;
        std::vector<Tunnel> tunnels;
        std::vector<Bridge> bridges;
        AdditionalData extra;

        bool operator==(const Objects& o) const
        {
            return std::tie(objects, references, tunnels, bridges, extra) ==
                std::tie(o.objects, o.references, o.tunnels, o.bridges, o.extra);
        }
        bool operator!=(const Objects& o) const { return !(*this == o); }
    };
}
