#include "geometry.h"
#include "errors.h"
#include "constants.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <vector>

namespace
{
    using namespace XodrCodec;

    // 5-point Gauss-Legendre on [-1, 1]
    const std::array<double, 5> GLNodes = {
        0.0, -0.5384693101056831, 0.5384693101056831, -0.9061798459386640, 0.9061798459386640 };
    const std::array<double, 5> GLWeights = {
        0.5688888888888889, 0.4786286704993665, 0.4786286704993665, 0.2369268850561891, 0.2369268850561891 };

    double GaussLegendre(const std::function<double(double)>& f, double a, double b)
    {
        const double half = 0.5 * (b - a);
        const double mid = 0.5 * (a + b);
        double sum = 0;
        for (size_t i = 0; i != GLNodes.size(); ++i)
        {
            sum += GLWeights[i] * f(mid + half * GLNodes[i]);
        }
        return sum * half;
    }

    // sin(x) / x, accurate near 0
    double Sinc(double x)
    {
        if (std::abs(x) < 1e-4)
        {
            const double x2 = x * x;
            return 1 - x2 / 6 + x2 * x2 / 120;
        }
        return std::sin(x) / x;
    }

    Pose ToGlobal(const Geometry& g, double u, double v, double localHdg)
    {
        const double h = g.Hdg().Value();
        const double c = std::cos(h), s = std::sin(h);
        return Pose{
            Length(g.X().Value() + u * c - v * s),
            Length(g.Y().Value() + u * s + v * c),
            Angle(h + localHdg) };
    }

    /*Arc length parameterization of a cubic curve with the given speed |dC/dp| over [0, pEnd].
    * Returns p such that the arc length from 0 to p equals target.
    */
    class ArcLengthTable
    {
    public:
        ArcLengthTable(std::function<double(double)> speedFn, double end) :
            speed(std::move(speedFn)), pEnd(end)
        {
            cumulative.resize(CubicLengthPieces + 1, 0);
            for (int i = 0; i != CubicLengthPieces; ++i)
            {
                cumulative[i + 1] = cumulative[i] + GaussLegendre(speed, P(i), P(i + 1));
            }
        }

        double Total() const { return cumulative.back(); }

        double Invert(double target) const
        {
            if (target <= 0) return 0;
            if (target >= Total()) return pEnd;

            auto it = std::upper_bound(cumulative.begin(), cumulative.end(), target);
            int piece = static_cast<int>(it - cumulative.begin()) - 1;
            piece = std::clamp(piece, 0, CubicLengthPieces - 1);

            double lo = P(piece), hi = P(piece + 1);
            const double base = cumulative[piece];
            double p = lo + (hi - lo) * (target - base) / std::max(cumulative[piece + 1] - base, 1e-300);
            for (int iter = 0; iter != ArcLengthMaxIterations; ++iter)
            {
                const double f = base + GaussLegendre(speed, P(piece), p) - target;
                if (std::abs(f) <= ArcLengthTolerance * std::max(1.0, target))
                {
                    break;
                }
                if (f > 0) hi = p; else lo = p;

                const double df = speed(p);
                double next = df > 0 ? p - f / df : 0.5 * (lo + hi);
                if (!(next > lo && next < hi))
                {
                    next = 0.5 * (lo + hi);
                }
                p = next;
            }
            return p;
        }

    private:
        double P(int i) const
        {
            return i == CubicLengthPieces ? pEnd : pEnd * i / CubicLengthPieces;
        }

        std::function<double(double)> speed;
        double pEnd;
        std::vector<double> cumulative;
    };

    Pose EvaluateLine(const Geometry& g, double o)
    {
        return ToGlobal(g, o, 0, 0);
    }

    Pose EvaluateArc(const Geometry& g, const ArcShape& arc, double o)
    {
        const double k = arc.curvature.Value();
        const double half = 0.5 * k * o;
        const double chord = o * Sinc(half);
        return ToGlobal(g, chord * std::cos(half), chord * std::sin(half), k * o);
    }

    Pose EvaluateSpiral(const Geometry& g, const SpiralShape& spiral, double o)
    {
        const double k0 = spiral.curvStart.Value();
        const double len = g.GetLength().Value();
        const double rate = len > 0 ? (spiral.curvEnd.Value() - k0) / len : 0;

        // Local heading theta(t) = k0 t + rate t^2 / 2
        auto theta = [k0, rate](double t) { return k0 * t + 0.5 * rate * t * t; };

        const double maxCurvature = std::max(std::abs(k0), std::abs(k0 + rate * o));
        double pieces = std::max(std::ceil(o / SpiralMaxPieceLength),
            std::ceil(o * maxCurvature / SpiralMaxPieceTurn));
        int n = static_cast<int>(std::clamp(pieces, 1.0, static_cast<double>(1 << 20)));

        double u = 0, v = 0;
        for (int i = 0; i != n; ++i)
        {
            const double a = o * i / n;
            const double b = (i + 1 == n) ? o : o * (i + 1) / n;
            u += GaussLegendre([&theta](double t) { return std::cos(theta(t)); }, a, b);
            v += GaussLegendre([&theta](double t) { return std::sin(theta(t)); }, a, b);
        }
        return ToGlobal(g, u, v, theta(o));
    }

    Pose EvaluatePoly3(const Geometry& g, const Poly3Shape& poly, double o)
    {
        auto dv = [&poly](double u) { return poly.b + 2 * poly.c * u + 3 * poly.d * u * u; };
        double u = 0;
        if (o > 0)
        {
            // Arc length >= u, so the local u of offset o never exceeds o.
            ArcLengthTable table([&dv](double t) { return std::sqrt(1 + dv(t) * dv(t)); },
                g.GetLength().Value());
            u = table.Invert(o);
        }
        const double v = poly.a + poly.b * u + poly.c * u * u + poly.d * u * u * u;
        return ToGlobal(g, u, v, std::atan(dv(u)));
    }

    Pose EvaluateParamPoly3(const Geometry& g, const ParamPoly3Shape& poly, double o)
    {
        const double len = g.GetLength().Value();
        const double pEnd = poly.pRange == ParamPoly3Range::Normalized ? 1.0 : len;

        auto du = [&poly](double p) { return poly.bU + 2 * poly.cU * p + 3 * poly.dU * p * p; };
        auto dv = [&poly](double p) { return poly.bV + 2 * poly.cV * p + 3 * poly.dV * p * p; };

        double p = 0;
        if (o <= 0)
        {
            p = 0;
        }
        else if (o >= len)
        {
            p = pEnd;
        }
        else
        {
            // Declared length is authoritative: scale curve arc length so that offset == length hits p == pEnd
            ArcLengthTable table([&du, &dv](double t) { return std::hypot(du(t), dv(t)); }, pEnd);
            if (table.Total() > 0)
            {
                p = table.Invert(o / len * table.Total());
            }
            else
            {
                p = o / len * pEnd;
            }
        }

        const double u = poly.aU + poly.bU * p + poly.cU * p * p + poly.dU * p * p * p;
        const double v = poly.aV + poly.bV * p + poly.cV * p * p + poly.dV * p * p * p;
        return ToGlobal(g, u, v, std::atan2(dv(p), du(p)));
    }

    struct ShapeEvaluator
    {
        const Geometry& g;
        double offset;

        Pose operator()(const LineShape&) const { return EvaluateLine(g, offset); }
        Pose operator()(const ArcShape& arc) const { return EvaluateArc(g, arc, offset); }
        Pose operator()(const SpiralShape& spiral) const { return EvaluateSpiral(g, spiral, offset); }
        Pose operator()(const Poly3Shape& poly) const { return EvaluatePoly3(g, poly, offset); }
        Pose operator()(const ParamPoly3Shape& poly) const { return EvaluateParamPoly3(g, poly, offset); }
    };

    struct ShapeNamer
    {
        const char* operator()(const LineShape&) const { return "line"; }
        const char* operator()(const SpiralShape&) const { return "spiral"; }
        const char* operator()(const ArcShape&) const { return "arc"; }
        const char* operator()(const Poly3Shape&) const { return "poly3"; }
        const char* operator()(const ParamPoly3Shape&) const { return "paramPoly3"; }
    };
}

namespace XodrCodec
{
    Geometry::Geometry(Length s_, Length x_, Length y_, Angle hdg_, Length length_,
        GeometryShape shape_, AdditionalData extra_) :
        s(s_), x(x_), y(y_), hdg(hdg_), length(length_), shape(std::move(shape_)), extra(std::move(extra_))
    {
        if (!std::isfinite(length.Value()) || length.Value() < 0)
        {
            throw std::invalid_argument("Geometry length must be finite and non-negative");
        }
        if (!std::isfinite(s.Value()) || s.Value() < 0)
        {
            throw std::invalid_argument("Geometry s must be finite and non-negative");
        }
    }

    Pose Geometry::Evaluate(Length offset) const
    {
        const double o = offset.Value();
        if (!(o >= 0 && o <= length.Value()))
        {
            throw GeometryError(o, length.Value());
        }

        return std::visit(ShapeEvaluator{ *this, o }, shape);
    }

    bool Geometry::operator==(const Geometry& o) const
    {
        return s == o.s && x == o.x && y == o.y && hdg == o.hdg && length == o.length &&
            shape == o.shape && extra == o.extra;
    }

    const char* ShapeElementName(const GeometryShape& shape)
    {
        return std::visit(ShapeNamer{}, shape);
    }
}
