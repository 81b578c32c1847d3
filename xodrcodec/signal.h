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
    struct SignalDependency
    {
        std::string id;
        std::optional<std::string> type;

        bool operator==(const SignalDependency& o) const
        {
            return std::tie(id, type) == std::tie(o.id, o.type);
        }
        bool operator!=(const SignalDependency& o) const { return !(*this == o); }
    };

    // Link from a signal to an object or another signal
    struct SignalLinkedElement
    {
        SignalElementType elementType = SignalElementType::Signal;
        std::string elementId;
        std::optional<std::string> type;

        bool operator==(const SignalLinkedElement& o) const
        {
            return std::tie(elementType, elementId, type) == std::tie(o.elementType, o.elementId, o.type);
        }
        bool operator!=(const SignalLinkedElement& o) const { return !(*this == o); }
    };

    // Physical placement on a road other than the one the signal controls
    struct SignalPositionRoad
    {
        std::string roadId;
        Length s;
        Length t;
        Length zOffset;
        Angle hOffset;
        std::optional<Angle> pitch;
        std::optional<Angle> roll;

        bool operator==(const SignalPositionRoad& o) const
        {
            return std::tie(roadId, s, t, zOffset, hOffset, pitch, roll) ==
                std::tie(o.roadId, o.s, o.t, o.zOffset, o.hOffset, o.pitch, o.roll);
        }
        bool operator!=(const SignalPositionRoad& o) const { return !(*this == o); }
    };

    struct SignalPositionInertial
    {
        Length x;
        Length y;
        Length z;
        Angle hdg;
        std::optional<Angle> pitch;
        std::optional<Angle> roll;

        bool operator==(const SignalPositionInertial& o) const
        {
            return std::tie(x, y, z, hdg, pitch, roll) == std::tie(o.x, o.y, o.z, o.hdg, o.pitch, o.roll);
        }
        bool operator!=(const SignalPositionInertial& o) const { return !(*this == o); }
    };

    using SignalPosition = std::variant<SignalPositionRoad, SignalPositionInertial>;

    struct Signal
    {
        std::string id;
        std::optional<std::string> name;
        Length s;
        Length t;
        bool dynamic = false;  // yes / no
        Orientation orientation = Orientation::Plus;
        Length zOffset;
        std::optional<std::string> country;
        std::optional<std::string> countryRevision;
        std::string type;
        std::string subtype;
        std::optional<double> value;
        std::optional<SignalUnit> unit;
        std::optional<Length> height;
        std::optional<Length> width;
        std::optional<std::string> text;
        std::optional<Angle> hOffset;
        std::optional<Angle> pitch;
        std::optional<Angle> roll;
        std::vector<LaneValidity> validities;
        std::vector<SignalDependency> dependencies;
        std::vector<SignalLinkedElement> references;
        std::optional<SignalPosition> position;
        AdditionalData extra;

        bool operator==(const Signal& o) const
        {
            return std::tie(id, name, s, t, dynamic, orientation, zOffset, country, countryRevision, type,
                subtype, value, unit, height, width, text, hOffset, pitch, roll, validities, dependencies,
                references, position, extra) ==
                std::tie(o.id, o.name, o.s, o.t, o.dynamic, o.orientation, o.zOffset, o.country,
                    o.countryRevision, o.type, o.subtype, o.value, o.unit, o.height, o.width, o.text,
                    o.hOffset, o.pitch, o.roll, o.validities, o.dependencies, o.references, o.position,
                    o.extra);
        }
        bool operator!=(const Signal& o) const { return !(*this == o); }
    };

    // Reuse of a signal defined on another road
    struct SignalReference
    {
        std::string id;
        Length s;
        Length t;
        Orientation orientation = Orientation::Plus;
        std::vector<LaneValidity> validities;

        bool operator==(const SignalReference& o) const
        {
            return std::tie(id, s, t, orientation, validities) ==
                std::tie(o.id, o.s, o.t, o.orientation, o.validities);
        }
        bool operator!=(const SignalReference& o) const { return !(*this == o); }
    };

    struct Signals
    {
        std::vector<Signal> signals;
        std::vector<SignalReference> references;
        AdditionalData extra;

        bool operator==(const Signals& o) const
        {
            return std::tie(signals, references, extra) == std::tie(o.signals, o.references, o.extra);
        }
        bool operator!=(const Signals& o) const { return !(*this == o); }
    };

    struct ControllerControl
    {
        std::string signalId;
        std::optional<std::string> type;

        bool operator==(const ControllerControl& o) const
        {
            return std::tie(signalId, type) == std::tie(o.signalId, o.type);
        }
        bool operator!=(const ControllerControl& o) const { return !(*this == o); }
    };

    // Top level signal group switched together
    struct Controller
    {
        std::string id;
        std::optional<std::string> name;
        std::optional<unsigned> sequence;
        std::vector<ControllerControl> controls;  // at least one
        AdditionalData extra;

        bool operator==(const Controller& o) const
        {
            return std::tie(id, name, sequence, controls, extra) ==
                std::tie(o.id, o.name, o.sequence, o.controls, o.extra);
        }
        bool operator!=(const Controller& o) const { return !(*this == o); }
    };
}
