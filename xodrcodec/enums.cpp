#include "enums.h"

#include <stdexcept>
#include <utility>

namespace
{
    template <typename E>
    struct Table;

#define XODRCODEC_ENUM_TABLE(E, SchemaName, ...)                                   \
    template <>                                                                    \
    struct Table<XodrCodec::E>                                                     \
    {                                                                              \
        static const char* Name() { return SchemaName; }                           \
        static const std::vector<std::pair<XodrCodec::E, const char*>>& Entries()  \
        {                                                                          \
            using V = XodrCodec::E;                                                \
            static const std::vector<std::pair<V, const char*>> entries{__VA_ARGS__}; \
            return entries;                                                        \
        }                                                                          \
    };

    XODRCODEC_ENUM_TABLE(ParamPoly3Range, "e_paramPoly3_pRange",
        {V::ArcLength, "arcLength"}, {V::Normalized, "normalized"})

    XODRCODEC_ENUM_TABLE(TrafficRule, "e_trafficRule",
        {V::RHT, "RHT"}, {V::LHT, "LHT"})

    XODRCODEC_ENUM_TABLE(ElementType, "e_road_link_elementType",
        {V::Road, "road"}, {V::Junction, "junction"})

    XODRCODEC_ENUM_TABLE(ContactPoint, "e_contactPoint",
        {V::Start, "start"}, {V::End, "end"})

    XODRCODEC_ENUM_TABLE(ElementDir, "e_elementDir",
        {V::Plus, "+"}, {V::Minus, "-"})

    XODRCODEC_ENUM_TABLE(RoadType, "e_roadType",
        {V::Unknown, "unknown"}, {V::Rural, "rural"}, {V::Motorway, "motorway"},
        {V::Town, "town"}, {V::LowSpeed, "lowSpeed"}, {V::Pedestrian, "pedestrian"},
        {V::Bicycle, "bicycle"}, {V::TownExpressway, "townExpressway"},
        {V::TownCollector, "townCollector"}, {V::TownArterial, "townArterial"},
        {V::TownPrivate, "townPrivate"}, {V::TownLocal, "townLocal"},
        {V::TownPlayStreet, "townPlayStreet"})

    XODRCODEC_ENUM_TABLE(SpeedUnit, "e_unitSpeed",
        {V::MetersPerSecond, "m/s"}, {V::KilometersPerHour, "km/h"}, {V::MilesPerHour, "mph"})

    XODRCODEC_ENUM_TABLE(LaneType, "e_laneType",
        {V::Shoulder, "shoulder"}, {V::Border, "border"}, {V::Driving, "driving"},
        {V::Stop, "stop"}, {V::None, "none"}, {V::Restricted, "restricted"},
        {V::Parking, "parking"}, {V::Median, "median"}, {V::Biking, "biking"},
        {V::Sidewalk, "sidewalk"}, {V::Curb, "curb"}, {V::Exit, "exit"}, {V::Entry, "entry"},
        {V::OnRamp, "onRamp"}, {V::OffRamp, "offRamp"}, {V::ConnectingRamp, "connectingRamp"},
        {V::Bidirectional, "bidirectional"}, {V::Special1, "special1"},
        {V::Special2, "special2"}, {V::Special3, "special3"}, {V::RoadWorks, "roadWorks"},
        {V::Tram, "tram"}, {V::Rail, "rail"}, {V::Bus, "bus"}, {V::Taxi, "taxi"}, {V::HOV, "HOV"})

    XODRCODEC_ENUM_TABLE(RoadMarkType, "e_roadMarkType",
        {V::None, "none"}, {V::Solid, "solid"}, {V::Broken, "broken"},
        {V::SolidSolid, "solid solid"}, {V::SolidBroken, "solid broken"},
        {V::BrokenSolid, "broken solid"}, {V::BrokenBroken, "broken broken"},
        {V::BottsDots, "botts dots"}, {V::Grass, "grass"}, {V::Curb, "curb"},
        {V::Custom, "custom"}, {V::Edge, "edge"})

    XODRCODEC_ENUM_TABLE(RoadMarkWeight, "e_roadMarkWeight",
        {V::Standard, "standard"}, {V::Bold, "bold"})

    XODRCODEC_ENUM_TABLE(RoadMarkColor, "e_roadMarkColor",
        {V::Standard, "standard"}, {V::Black, "black"}, {V::Blue, "blue"}, {V::Green, "green"},
        {V::Red, "red"}, {V::White, "white"}, {V::Yellow, "yellow"}, {V::Orange, "orange"},
        {V::Violet, "violet"})

    XODRCODEC_ENUM_TABLE(LaneChange, "e_road_lanes_laneSection_lcr_lane_roadMark_laneChange",
        {V::Increase, "increase"}, {V::Decrease, "decrease"}, {V::Both, "both"}, {V::None, "none"})

    XODRCODEC_ENUM_TABLE(RoadMarkRule, "e_roadMarkRule",
        {V::NoPassing, "no passing"}, {V::Caution, "caution"}, {V::None, "none"})

    XODRCODEC_ENUM_TABLE(AccessRestriction, "e_accessRestrictionType",
        {V::Simulator, "simulator"}, {V::AutonomousTraffic, "autonomousTraffic"},
        {V::Pedestrian, "pedestrian"}, {V::PassengerCar, "passengerCar"}, {V::Bus, "bus"},
        {V::Delivery, "delivery"}, {V::Emergency, "emergency"}, {V::Taxi, "taxi"},
        {V::ThroughTraffic, "throughTraffic"}, {V::Truck, "truck"}, {V::Bicycle, "bicycle"},
        {V::Motorcycle, "motorcycle"}, {V::None, "none"}, {V::Trucks, "trucks"})

    XODRCODEC_ENUM_TABLE(AccessRule, "e_road_lanes_laneSection_lr_lane_access_rule",
        {V::Allow, "allow"}, {V::Deny, "deny"})

    XODRCODEC_ENUM_TABLE(JunctionType, "e_junction_type",
        {V::Default, "default"}, {V::Virtual, "virtual"}, {V::Direct, "direct"})

    XODRCODEC_ENUM_TABLE(ConnectionType, "e_connection_type",
        {V::Default, "default"}, {V::Virtual, "virtual"})

    XODRCODEC_ENUM_TABLE(Orientation, "e_orientation",
        {V::Plus, "+"}, {V::Minus, "-"}, {V::None, "none"})

    XODRCODEC_ENUM_TABLE(ObjectType, "e_objectType",
        {V::None, "none"}, {V::Obstacle, "obstacle"}, {V::Car, "car"}, {V::Pole, "pole"},
        {V::Tree, "tree"}, {V::Vegetation, "vegetation"}, {V::Barrier, "barrier"},
        {V::Building, "building"}, {V::ParkingSpace, "parkingSpace"}, {V::Patch, "patch"},
        {V::Railing, "railing"}, {V::TrafficIsland, "trafficIsland"},
        {V::Crosswalk, "crosswalk"}, {V::StreetLamp, "streetLamp"}, {V::Gantry, "gantry"},
        {V::SoundBarrier, "soundBarrier"}, {V::Van, "van"}, {V::Bus, "bus"},
        {V::Trailer, "trailer"}, {V::Bike, "bike"}, {V::Motorbike, "motorbike"},
        {V::Tram, "tram"}, {V::Train, "train"}, {V::Pedestrian, "pedestrian"},
        {V::Wind, "wind"}, {V::RoadMark, "roadMark"})

    XODRCODEC_ENUM_TABLE(TunnelType, "e_tunnelType",
        {V::Standard, "standard"}, {V::Underpass, "underpass"})

    XODRCODEC_ENUM_TABLE(BridgeType, "e_bridgeType",
        {V::Concrete, "concrete"}, {V::Steel, "steel"}, {V::Brick, "brick"}, {V::Wood, "wood"})

    XODRCODEC_ENUM_TABLE(DataSource, "e_dataQuality_RawData_Source",
        {V::Sensor, "sensor"}, {V::Cadaster, "cadaster"}, {V::Custom, "custom"})

    XODRCODEC_ENUM_TABLE(PostProcessing, "e_dataQuality_RawData_PostProcessing",
        {V::Raw, "raw"}, {V::Cleaned, "cleaned"}, {V::Processed, "processed"}, {V::Fused, "fused"})

    XODRCODEC_ENUM_TABLE(SignalUnit, "e_unit",
        {V::Meter, "m"}, {V::Kilometer, "km"}, {V::Feet, "ft"}, {V::Mile, "mile"},
        {V::MetersPerSecond, "m/s"}, {V::MilesPerHour, "mph"}, {V::KilometersPerHour, "km/h"},
        {V::Kilogram, "kg"}, {V::Ton, "t"}, {V::Percent, "%"})

    XODRCODEC_ENUM_TABLE(SignalElementType, "e_road_signals_signal_reference_elementType",
        {V::Object, "object"}, {V::Signal, "signal"})

    XODRCODEC_ENUM_TABLE(OutlineFillType, "e_outlineFillType",
        {V::Grass, "grass"}, {V::Concrete, "concrete"}, {V::Cobble, "cobble"}, {V::Asphalt, "asphalt"},
        {V::Pavement, "pavement"}, {V::Gravel, "gravel"}, {V::Soil, "soil"})

    XODRCODEC_ENUM_TABLE(ParkingAccess, "e_accessRestrictionType",
        {V::All, "all"}, {V::Car, "car"}, {V::Women, "women"}, {V::Handicapped, "handicapped"},
        {V::Bus, "bus"}, {V::Truck, "truck"}, {V::Electric, "electric"}, {V::Residents, "residents"})

    XODRCODEC_ENUM_TABLE(MarkingSide, "e_sideType",
        {V::Left, "left"}, {V::Right, "right"}, {V::Front, "front"}, {V::Rear, "rear"})

    XODRCODEC_ENUM_TABLE(ObjectBorderType, "e_borderType",
        {V::Concrete, "concrete"}, {V::Curb, "curb"})

    XODRCODEC_ENUM_TABLE(RoadCrgMode, "e_road_surface_CRG_mode",
        {V::Attached, "attached"}, {V::Attached0, "attached0"}, {V::Genuine, "genuine"}, {V::Global, "global"})

    XODRCODEC_ENUM_TABLE(JunctionCrgMode, "e_junction_surface_CRG_mode",
        {V::Global, "global"})

    XODRCODEC_ENUM_TABLE(CrgPurpose, "e_road_surface_CRG_purpose",
        {V::Elevation, "elevation"}, {V::Friction, "friction"})

    XODRCODEC_ENUM_TABLE(CrgOrientation, "e_direction",
        {V::Same, "same"}, {V::Opposite, "opposite"})

    XODRCODEC_ENUM_TABLE(JunctionGroupType, "e_junctionGroup_type",
        {V::Roundabout, "roundabout"}, {V::Unknown, "unknown"})

    XODRCODEC_ENUM_TABLE(SwitchPosition, "e_road_railroad_switch_position",
        {V::Dynamic, "dynamic"}, {V::Straight, "straight"}, {V::Turn, "turn"})

    XODRCODEC_ENUM_TABLE(StationType, "e_station_type",
        {V::Small, "small"}, {V::Medium, "medium"}, {V::Large, "large"})

    XODRCODEC_ENUM_TABLE(SegmentSide, "e_station_platform_segment_side",
        {V::Left, "left"}, {V::Right, "right"})

#undef XODRCODEC_ENUM_TABLE
}

namespace XodrCodec
{
    template <typename E>
    const char* EnumToString(E value)
    {
        for (const auto& entry : Table<E>::Entries())
        {
            if (entry.first == value)
            {
                return entry.second;
            }
        }
        throw std::logic_error(std::string("Value out of range for ") + Table<E>::Name());
    }

    template <typename E>
    bool EnumFromString(const std::string& text, E& out)
    {
        for (const auto& entry : Table<E>::Entries())
        {
            if (text == entry.second)
            {
                out = entry.first;
                return true;
            }
        }
        return false;
    }

    template <typename E>
    const char* EnumTypeName()
    {
        return Table<E>::Name();
    }

    template <typename E>
    std::vector<E> EnumValues()
    {
        std::vector<E> rtn;
        for (const auto& entry : Table<E>::Entries())
        {
            rtn.push_back(entry.first);
        }
        return rtn;
    }

#define XODRCODEC_ENUM_INSTANTIATE(E)                                   \
    template const char* EnumToString<E>(E);                            \
    template bool EnumFromString<E>(const std::string&, E&);            \
    template const char* EnumTypeName<E>();                             \
    template std::vector<E> EnumValues<E>();

    XODRCODEC_ENUM_INSTANTIATE(ParamPoly3Range)
    XODRCODEC_ENUM_INSTANTIATE(TrafficRule)
    XODRCODEC_ENUM_INSTANTIATE(ElementType)
    XODRCODEC_ENUM_INSTANTIATE(ContactPoint)
    XODRCODEC_ENUM_INSTANTIATE(ElementDir)
    XODRCODEC_ENUM_INSTANTIATE(RoadType)
    XODRCODEC_ENUM_INSTANTIATE(SpeedUnit)
    XODRCODEC_ENUM_INSTANTIATE(LaneType)
    XODRCODEC_ENUM_INSTANTIATE(RoadMarkType)
    XODRCODEC_ENUM_INSTANTIATE(RoadMarkWeight)
    XODRCODEC_ENUM_INSTANTIATE(RoadMarkColor)
    XODRCODEC_ENUM_INSTANTIATE(LaneChange)
    XODRCODEC_ENUM_INSTANTIATE(RoadMarkRule)
    XODRCODEC_ENUM_INSTANTIATE(AccessRestriction)
    XODRCODEC_ENUM_INSTANTIATE(AccessRule)
    XODRCODEC_ENUM_INSTANTIATE(JunctionType)
    XODRCODEC_ENUM_INSTANTIATE(ConnectionType)
    XODRCODEC_ENUM_INSTANTIATE(Orientation)
    XODRCODEC_ENUM_INSTANTIATE(ObjectType)
    XODRCODEC_ENUM_INSTANTIATE(TunnelType)
    XODRCODEC_ENUM_INSTANTIATE(BridgeType)
    XODRCODEC_ENUM_INSTANTIATE(DataSource)
    XODRCODEC_ENUM_INSTANTIATE(PostProcessing)
    XODRCODEC_ENUM_INSTANTIATE(SignalUnit)
    XODRCODEC_ENUM_INSTANTIATE(SignalElementType)
    XODRCODEC_ENUM_INSTANTIATE(OutlineFillType)
    XODRCODEC_ENUM_INSTANTIATE(ParkingAccess)
    XODRCODEC_ENUM_INSTANTIATE(MarkingSide)
    XODRCODEC_ENUM_INSTANTIATE(ObjectBorderType)
    XODRCODEC_ENUM_INSTANTIATE(RoadCrgMode)
    XODRCODEC_ENUM_INSTANTIATE(JunctionCrgMode)
    XODRCODEC_ENUM_INSTANTIATE(CrgPurpose)
    XODRCODEC_ENUM_INSTANTIATE(CrgOrientation)
    XODRCODEC_ENUM_INSTANTIATE(JunctionGroupType)
    XODRCODEC_ENUM_INSTANTIATE(SwitchPosition)
    XODRCODEC_ENUM_INSTANTIATE(StationType)
    XODRCODEC_ENUM_INSTANTIATE(SegmentSide)

#undef XODRCODEC_ENUM_INSTANTIATE
}
