#pragma once

#include <string>
#include <cmath>

namespace XodrCodec
{
    const double Pi = 3.14159265358979323846;
    const double DegPerRad = 180.0 / Pi;
    const double RadPerDeg = Pi / 180.0;

    struct MeterDim {};
    struct RadianDim {};
    struct PerMeterDim {};

    /*Magnitude with a compile-time unit. The unit of each field is fixed
    * by its position in the schema, so no unit text is ever parsed or written.
    */
    template <typename Dim>
    class Quantity
    {
    public:
        constexpr Quantity() = default;
        constexpr explicit Quantity(double v) : magnitude(v) {}

        constexpr double Value() const { return magnitude; }

        Quantity& operator+=(Quantity rhs) { magnitude += rhs.magnitude; return *this; }
        Quantity& operator-=(Quantity rhs) { magnitude -= rhs.magnitude; return *this; }

        constexpr Quantity operator-() const { return Quantity(-magnitude); }
        constexpr Quantity operator+(Quantity rhs) const { return Quantity(magnitude + rhs.magnitude); }
        constexpr Quantity operator-(Quantity rhs) const { return Quantity(magnitude - rhs.magnitude); }
        constexpr Quantity operator*(double f) const { return Quantity(magnitude * f); }
        constexpr Quantity operator/(double f) const { return Quantity(magnitude / f); }

        constexpr bool operator==(Quantity rhs) const { return magnitude == rhs.magnitude; }
        constexpr bool operator!=(Quantity rhs) const { return magnitude != rhs.magnitude; }
        constexpr bool operator<(Quantity rhs) const { return magnitude < rhs.magnitude; }
        constexpr bool operator<=(Quantity rhs) const { return magnitude <= rhs.magnitude; }
        constexpr bool operator>(Quantity rhs) const { return magnitude > rhs.magnitude; }
        constexpr bool operator>=(Quantity rhs) const { return magnitude >= rhs.magnitude; }

    private:
        double magnitude = 0;
    };

    using Length = Quantity<MeterDim>;
    using Angle = Quantity<RadianDim>;
    using Curvature = Quantity<PerMeterDim>;

    enum class SpeedUnit
    {
        MetersPerSecond,
        KilometersPerHour,
        MilesPerHour
    };

    enum class NumberFault
    {
        None,
        Malformed,  // not a decimal literal, or trailing garbage
        OutOfRange  // literal overflows a double
    };

    /*Strict decimal literal: [+-]? (digits [. digits?] | . digits) ([eE] [+-]? digits)?
    * Leading / trailing XML whitespace is tolerated. nan, inf and hex floats are rejected.
    */
    NumberFault ParseNumber(const std::string& text, double& out);

    NumberFault ParseInteger(const std::string& text, long long& out);

    // Shortest decimal text that parses back to exactly v
    std::string FormatNumber(double v);

    inline Angle DegreesToAngle(double degrees) { return Angle(degrees * RadPerDeg); }
    inline double AngleToDegrees(Angle a) { return a.Value() * DegPerRad; }

    double SpeedToMetersPerSecond(double value, SpeedUnit unit);
}
