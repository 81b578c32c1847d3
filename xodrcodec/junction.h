#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "units.h"
#include "enums.h"
#include "additional_data.h"

namespace XodrCodec
{
    struct JunctionLaneLink
    {
        int from = 0;
        int to = 0;

        bool operator==(const JunctionLaneLink& o) const { return from == o.from && to == o.to; }
        bool operator!=(const JunctionLaneLink& o) const { return !(*this == o); }
    };

    // Predecessor / successor of a virtual connection
    struct VirtualConnectionEnd
    {
        std::string elementType;
        std::string elementId;
        Length elementS;
        ElementDir elementDir = ElementDir::Plus;

        bool operator==(const VirtualConnectionEnd& o) const
        {
            return std::tie(elementType, elementId, elementS, elementDir) ==
                std::tie(o.elementType, o.elementId, o.elementS, o.elementDir);
        }
        bool operator!=(const VirtualConnectionEnd& o) const { return !(*this == o); }
    };

    struct Connection
    {
        std::string id;
        ConnectionType type = ConnectionType::Default;
        std::optional<std::string> incomingRoad;
        std::optional<std::string> connectingRoad;
        std::optional<std::string> linkedRoad;
        std::optional<ContactPoint> contactPoint;
        std::optional<VirtualConnectionEnd> predecessor;
        std::optional<VirtualConnectionEnd> successor;
        std::vector<JunctionLaneLink> laneLinks;

        bool operator==(const Connection& o) const
        {
            return std::tie(id, type, incomingRoad, connectingRoad, linkedRoad, contactPoint,
                predecessor, successor, laneLinks) ==
                std::tie(o.id, o.type, o.incomingRoad, o.connectingRoad, o.linkedRoad, o.contactPoint,
                    o.predecessor, o.successor, o.laneLinks);
        }
        bool operator!=(const Connection& o) const { return !(*this == o); }
    };

    // Incoming road "high" has right of way over incoming road "low"
    struct JunctionPriority
    {
        std::optional<std::string> high;
        std::optional<std::string> low;

        bool operator==(const JunctionPriority& o) const
        {
            return std::tie(high, low) == std::tie(o.high, o.low);
        }
        bool operator!=(const JunctionPriority& o) const { return !(*this == o); }
    };

    struct JunctionController
    {
        std::string id;
        std::optional<std::string> type;
        std::optional<unsigned> sequence;

        bool operator==(const JunctionController& o) const
        {
            return std::tie(id, type, sequence) == std::tie(o.id, o.type, o.sequence);
        }
        bool operator!=(const JunctionController& o) const { return !(*this == o); }
    };

    struct JunctionCrg
    {
        std::string file;
        JunctionCrgMode mode = JunctionCrgMode::Global;
        std::optional<CrgPurpose> purpose;
        std::optional<Length> zOffset;
        std::optional<double> zScale;

        bool operator==(const JunctionCrg& o) const
        {
            return std::tie(file, mode, purpose, zOffset, zScale) ==
                std::tie(o.file, o.mode, o.purpose, o.zOffset, o.zScale);
        }
        bool operator!=(const JunctionCrg& o) const { return !(*this == o); }
    };

    struct JunctionSurface
    {
        std::vector<JunctionCrg> crgs;
        AdditionalData extra;

        bool operator==(const JunctionSurface& o) const
        {
            return std::tie(crgs, extra) == std::tie(o.crgs, o.extra);
        }
        bool operator!=(const JunctionSurface& o) const { return !(*this == o); }
    };

    struct Junction
    {
        std::string id;
        std::optional<std::string> name;
        JunctionType type = JunctionType::Default;
        std::optional<std::string> mainRoad;
        std::optional<Orientation> orientation;
        std::optional<Length> sStart;
        std::optional<Length> sEnd;
        std::vector<Connection> connections;  // at least one
        std::vector<JunctionPriority> priorities;
        std::vector<JunctionController> controllers;
        std::optional<JunctionSurface> surface;
        AdditionalData extra;

        bool operator==(const Junction& o) const
        {
            return std::tie(id, name, type, mainRoad, orientation, sStart, sEnd, connections,
                priorities, controllers, surface, extra) ==
                std::tie(o.id, o.name, o.type, o.mainRoad, o.orientation, o.sStart, o.sEnd, o.connections,
                    o.priorities, o.controllers, o.surface, o.extra);
        }
        bool operator!=(const Junction& o) const { return !(*this == o); }
    };

    // Junctions forming one roundabout or other compound intersection
    struct JunctionGroup
    {
        std::string id;
        std::optional<std::string> name;
        JunctionGroupType type = JunctionGroupType::Unknown;
        std::vector<std::string> junctionReferences;  // at least one
        AdditionalData extra;

        bool operator==(const JunctionGroup& o) const
        {
            return std::tie(id, name, type, junctionReferences, extra) ==
                std::tie(o.id, o.name, o.type, o.junctionReferences, o.extra);
        }
        bool operator!=(const JunctionGroup& o) const { return !(*this == o); }
    };
}
