#pragma once

#include <variant>

#include "units.h"
#include "enums.h"
#include "additional_data.h"

namespace XodrCodec
{
    struct Pose
    {
        Length x;
        Length y;
        Angle hdg;
    };

    struct LineShape
    {
        bool operator==(const LineShape&) const { return true; }
        bool operator!=(const LineShape&) const { return false; }
    };

    struct ArcShape
    {
        Curvature curvature;

        bool operator==(const ArcShape& o) const { return curvature == o.curvature; }
        bool operator!=(const ArcShape& o) const { return !(*this == o); }
    };

    // Curvature changes linearly from curvStart to curvEnd over the segment
    struct SpiralShape
    {
        Curvature curvStart;
        Curvature curvEnd;

        bool operator==(const SpiralShape& o) const
        {
            return curvStart == o.curvStart && curvEnd == o.curvEnd;
        }
        bool operator!=(const SpiralShape& o) const { return !(*this == o); }
    };

    // v(u) = a + b*u + c*u^2 + d*u^3 in the start-heading frame
    struct Poly3Shape
    {
        double a = 0, b = 0, c = 0, d = 0;

        bool operator==(const Poly3Shape& o) const
        {
            return a == o.a && b == o.b && c == o.c && d == o.d;
        }
        bool operator!=(const Poly3Shape& o) const { return !(*this == o); }
    };

    struct ParamPoly3Shape
    {
        double aU = 0, bU = 0, cU = 0, dU = 0;
        double aV = 0, bV = 0, cV = 0, dV = 0;
        ParamPoly3Range pRange = ParamPoly3Range::Normalized;

        bool operator==(const ParamPoly3Shape& o) const
        {
            return aU == o.aU && bU == o.bU && cU == o.cU && dU == o.dU &&
                aV == o.aV && bV == o.bV && cV == o.cV && dV == o.dV && pRange == o.pRange;
        }
        bool operator!=(const ParamPoly3Shape& o) const { return !(*this == o); }
    };

    using GeometryShape = std::variant<LineShape, SpiralShape, ArcShape, Poly3Shape, ParamPoly3Shape>;

    /*One reference line segment. Immutable once constructed.
    * Negative / non-finite s or length is a caller bug (std::invalid_argument);
    * documents carrying such values are rejected by the reader before construction.
    */
    class Geometry
    {
    public:
        Geometry(Length s, Length x, Length y, Angle hdg, Length length,
            GeometryShape shape, AdditionalData extra = {});

        Length S() const { return s; }
        Length X() const { return x; }
        Length Y() const { return y; }
        Angle Hdg() const { return hdg; }
        Length GetLength() const { return length; }
        Length EndS() const { return s + length; }
        const GeometryShape& Shape() const { return shape; }
        const AdditionalData& Extra() const { return extra; }

        Pose Start() const { return Pose{ x, y, hdg }; }

        // Throws GeometryError (OffsetOutOfRange) unless 0 <= offset <= length
        Pose Evaluate(Length offset) const;

        Pose End() const { return Evaluate(length); }

        bool operator==(const Geometry& o) const;
        bool operator!=(const Geometry& o) const { return !(*this == o); }

    private:
        Length s;
        Length x;
        Length y;
        Angle hdg;
        Length length;
        GeometryShape shape;
        AdditionalData extra;
    };

    // Element name in <planView>: line, spiral, arc, poly3, paramPoly3
    const char* ShapeElementName(const GeometryShape& shape);
}
