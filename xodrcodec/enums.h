#pragma once

#include <string>
#include <vector>

#include "units.h"

namespace XodrCodec
{
    enum class ParamPoly3Range { ArcLength, Normalized };

    enum class TrafficRule { RHT, LHT };

    enum class ElementType { Road, Junction };

    enum class ContactPoint { Start, End };

    enum class ElementDir { Plus, Minus };

    enum class RoadType
    {
        Unknown, Rural, Motorway, Town, LowSpeed, Pedestrian, Bicycle,
        TownExpressway, TownCollector, TownArterial, TownPrivate, TownLocal, TownPlayStreet
    };

    enum class LaneType
    {
        Shoulder, Border, Driving, Stop, None, Restricted, Parking, Median, Biking,
        Sidewalk, Curb, Exit, Entry, OnRamp, OffRamp, ConnectingRamp, Bidirectional,
        Special1, Special2, Special3, RoadWorks, Tram, Rail, Bus, Taxi, HOV
    };

    enum class RoadMarkType
    {
        None, Solid, Broken, SolidSolid, SolidBroken, BrokenSolid, BrokenBroken,
        BottsDots, Grass, Curb, Custom, Edge
    };

    enum class RoadMarkWeight { Standard, Bold };

    enum class RoadMarkColor { Standard, Black, Blue, Green, Red, White, Yellow, Orange, Violet };

    enum class LaneChange { Increase, Decrease, Both, None };

    enum class RoadMarkRule { NoPassing, Caution, None };

    enum class AccessRestriction
    {
        Simulator, AutonomousTraffic, Pedestrian, PassengerCar, Bus, Delivery, Emergency,
        Taxi, ThroughTraffic, Truck, Bicycle, Motorcycle, None, Trucks
    };

    enum class AccessRule { Allow, Deny };

    enum class JunctionType { Default, Virtual, Direct };

    enum class ConnectionType { Default, Virtual };

    enum class Orientation { Plus, Minus, None };

    enum class ObjectType
    {
        None, Obstacle, Car, Pole, Tree, Vegetation, Barrier, Building, ParkingSpace,
        Patch, Railing, TrafficIsland, Crosswalk, StreetLamp, Gantry, SoundBarrier,
        Van, Bus, Trailer, Bike, Motorbike, Tram, Train, Pedestrian, Wind, RoadMark
    };

    enum class TunnelType { Standard, Underpass };

    enum class BridgeType { Concrete, Steel, Brick, Wood };

    enum class DataSource { Sensor, Cadaster, Custom };

    enum class PostProcessing { Raw, Cleaned, Processed, Fused };

    enum class SignalUnit { Meter, Kilometer, Feet, Mile, MetersPerSecond, MilesPerHour, KilometersPerHour, Kilogram, Ton, Percent };

    enum class SignalElementType { Object, Signal };

    enum class OutlineFillType { Grass, Concrete, Cobble, Asphalt, Pavement, Gravel, Soil };

    enum class ParkingAccess { All, Car, Women, Handicapped, Bus, Truck, Electric, Residents };

    enum class MarkingSide { Left, Right, Front, Rear };

    enum class ObjectBorderType { Concrete, Curb };

    enum class RoadCrgMode { Attached, Attached0, Genuine, Global };

    enum class JunctionCrgMode { Global };

    enum class CrgPurpose { Elevation, Friction };

    enum class CrgOrientation { Same, Opposite };

    enum class JunctionGroupType { Roundabout, Unknown };

    enum class SwitchPosition { Dynamic, Straight, Turn };

    enum class StationType { Small, Medium, Large };

    enum class SegmentSide { Left, Right };

    /*Table-driven enum <-> token mapping. Tokens match exactly (case sensitive).
    * Defined for every enum above plus SpeedUnit.
    */
    template <typename E>
    const char* EnumToString(E value);

    template <typename E>
    bool EnumFromString(const std::string& text, E& out);

    // Schema type name used in diagnostics, e.g. "e_laneType"
    template <typename E>
    const char* EnumTypeName();

    // All values in declaration order
    template <typename E>
    std::vector<E> EnumValues();
}
