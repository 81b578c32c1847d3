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
    // Track (road) a switch leads into, at position s driving in dir
    struct SwitchTrack
    {
        std::string id;
        Length s;
        ElementDir dir = ElementDir::Plus;

        bool operator==(const SwitchTrack& o) const
        {
            return std::tie(id, s, dir) == std::tie(o.id, o.s, o.dir);
        }
        bool operator!=(const SwitchTrack& o) const { return !(*this == o); }
    };

    struct SwitchPartner
    {
        std::string id;
        std::optional<std::string> name;

        bool operator==(const SwitchPartner& o) const
        {
            return std::tie(id, name) == std::tie(o.id, o.name);
        }
        bool operator!=(const SwitchPartner& o) const { return !(*this == o); }
    };

    struct RailroadSwitch
    {
        std::string name;
        std::string id;
        SwitchPosition position = SwitchPosition::Dynamic;
        SwitchTrack mainTrack;
        SwitchTrack sideTrack;
        std::optional<SwitchPartner> partner;
        AdditionalData extra;

        bool operator==(const RailroadSwitch& o) const
        {
            return std::tie(name, id, position, mainTrack, sideTrack, partner, extra) ==
                std::tie(o.name, o.id, o.position, o.mainTrack, o.sideTrack, o.partner, o.extra);
        }
        bool operator!=(const RailroadSwitch& o) const { return !(*this == o); }
    };

    struct Railroad
    {
        std::vector<RailroadSwitch> switches;
        AdditionalData extra;

        bool operator==(const Railroad& o) const
        {
            return std::tie(switches, extra) == std::tie(o.switches, o.extra);
        }
        bool operator!=(const Railroad& o) const { return !(*this == o); }
    };

    struct PlatformSegment
    {
        std::string roadId;
        Length sStart;
        Length sEnd;
        SegmentSide side = SegmentSide::Right;

        bool operator==(const PlatformSegment& o) const
        {
            return std::tie(roadId, sStart, sEnd, side) == std::tie(o.roadId, o.sStart, o.sEnd, o.side);
        }
        bool operator!=(const PlatformSegment& o) const { return !(*this == o); }
    };

    struct Platform
    {
        std::string id;
        std::optional<std::string> name;
        std::vector<PlatformSegment> segments;  // at least one
        AdditionalData extra;

        bool operator==(const Platform& o) const
        {
            return std::tie(id, name, segments, extra) == std::tie(o.id, o.name, o.segments, o.extra);
        }
        bool operator!=(const Platform& o) const { return !(*this == o); }
    };

    // Top-level <station>; platforms point at roads by id
    struct Station
    {
        std::string id;
        std::string name;
        std::optional<StationType> type;
        std::vector<Platform> platforms;  // at least one
        AdditionalData extra;

        bool operator==(const Station& o) const
        {
            return std::tie(id, name, type, platforms, extra) ==
                std::tie(o.id, o.name, o.type, o.platforms, o.extra);
        }
        bool operator!=(const Station& o) const { return !(*this == o); }
    };
}
