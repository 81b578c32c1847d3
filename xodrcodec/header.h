#pragma once

#include <optional>
#include <string>
#include <tuple>

#include "units.h"
#include "version.h"
#include "additional_data.h"

namespace XodrCodec
{
    // PROJ string, written as CDATA
    struct GeoReference
    {
        std::string projection;
        AdditionalData extra;

        bool operator==(const GeoReference& o) const
        {
            return std::tie(projection, extra) == std::tie(o.projection, o.extra);
        }
        bool operator!=(const GeoReference& o) const { return !(*this == o); }
    };

    // Inertial shift / rotation applied to all coordinates of the document
    struct HeaderOffset
    {
        Length x;
        Length y;
        Length z;
        Angle hdg;
        AdditionalData extra;

        bool operator==(const HeaderOffset& o) const
        {
            return std::tie(x, y, z, hdg, extra) == std::tie(o.x, o.y, o.z, o.hdg, o.extra);
        }
        bool operator!=(const HeaderOffset& o) const { return !(*this == o); }
    };

    struct Header
    {
        unsigned revMajor = StandardRevMajor;
        unsigned revMinor = StandardRevMinor;
        std::optional<std::string> name;
        std::optional<std::string> version;
        std::optional<std::string> date;
        std::optional<Length> north;
        std::optional<Length> south;
        std::optional<Length> east;
        std::optional<Length> west;
        std::optional<std::string> vendor;
        std::optional<GeoReference> geoReference;
        std::optional<HeaderOffset> offset;
        AdditionalData extra;

        bool operator==(const Header& o) const
        {
            return std::tie(revMajor, revMinor, name, version, date, north, south, east, west,
                vendor, geoReference, offset, extra) ==
                std::tie(o.revMajor, o.revMinor, o.name, o.version, o.date, o.north, o.south, o.east, o.west,
                    o.vendor, o.geoReference, o.offset, o.extra);
        }
        bool operator!=(const Header& o) const { return !(*this == o); }
    };
}
