#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "geometry.h"
#include "road.h"
#include "errors.h"
#include "test_const.h"

namespace XodrCodecTest
{
    using namespace XodrCodec;

    void ExpectPose(const Pose& pose, double x, double y, double hdg, double tolerance = epsilon_integral_result)
    {
        EXPECT_NEAR(pose.x.Value(), x, tolerance);
        EXPECT_NEAR(pose.y.Value(), y, tolerance);
        EXPECT_NEAR(pose.hdg.Value(), hdg, tolerance);
    }

    TEST(Geometry, LineMidpoint)
    {
        Geometry line(Length(0), Length(0), Length(0), Angle(0), Length(10), LineShape{});
        ExpectPose(line.Evaluate(Length(5)), 5, 0, 0, epsilon);
        ExpectPose(line.End(), 10, 0, 0, epsilon);
    }

    TEST(Geometry, RotatedLine)
    {
        Geometry line(Length(3), Length(1), Length(2), Angle(Pi / 2), Length(4), LineShape{});
        ExpectPose(line.Evaluate(Length(4)), 1, 6, Pi / 2);
        EXPECT_EQ(line.EndS(), Length(7));
    }

    TEST(Geometry, QuarterCircleArc)
    {
        const double radius = 10;
        Geometry arc(Length(0), Length(0), Length(0), Angle(0), Length(Pi * radius / 2), ArcShape{ Curvature(1 / radius) });
        ExpectPose(arc.End(), radius, radius, Pi / 2);

        Geometry rightTurn(Length(0), Length(0), Length(0), Angle(0), Length(Pi * radius / 2), ArcShape{ Curvature(-1 / radius) });
        ExpectPose(rightTurn.End(), radius, -radius, -Pi / 2);
    }

    TEST(Geometry, ZeroCurvatureShapesAreStraight)
    {
        Geometry spiral(Length(0), Length(0), Length(0), Angle(0), Length(20), SpiralShape{ Curvature(0), Curvature(0) });
        ExpectPose(spiral.End(), 20, 0, 0);

        Geometry arc(Length(0), Length(0), Length(0), Angle(0), Length(20), ArcShape{ Curvature(0) });
        ExpectPose(arc.End(), 20, 0, 0);

        Geometry poly(Length(0), Length(0), Length(0), Angle(0), Length(20), Poly3Shape{});
        ExpectPose(poly.End(), 20, 0, 0);
    }

    TEST(Geometry, SpiralHeadingIntegratesCurvature)
    {
        // heading(l) = k0 * l + (k1 - k0) * l^2 / (2 * L)
        const double length = 30, k0 = 0.0, k1 = 0.02;
        Geometry spiral(Length(0), Length(0), Length(0), Angle(0), Length(length), SpiralShape{ Curvature(k0), Curvature(k1) });
        EXPECT_NEAR(spiral.End().hdg.Value(), (k1 - k0) * length / 2, epsilon_integral_result);
        EXPECT_NEAR(spiral.Evaluate(Length(15)).hdg.Value(), (k1 - k0) * 15 * 15 / (2 * length), epsilon_integral_result);

        // Constant curvature spiral matches the arc
        Geometry constant(Length(0), Length(0), Length(0), Angle(0), Length(length), SpiralShape{ Curvature(0.05), Curvature(0.05) });
        Geometry arc(Length(0), Length(0), Length(0), Angle(0), Length(length), ArcShape{ Curvature(0.05) });
        auto a = constant.End(), b = arc.End();
        ExpectPose(a, b.x.Value(), b.y.Value(), b.hdg.Value());
    }

    TEST(Geometry, ParamPoly3RangesAgree)
    {
        ParamPoly3Shape normalized;
        normalized.bU = 10;
        normalized.pRange = ParamPoly3Range::Normalized;
        Geometry g1(Length(0), Length(0), Length(0), Angle(0), Length(10), normalized);
        ExpectPose(g1.Evaluate(Length(2.5)), 2.5, 0, 0);

        ParamPoly3Shape arcLength;
        arcLength.bU = 1;
        arcLength.pRange = ParamPoly3Range::ArcLength;
        Geometry g2(Length(0), Length(0), Length(0), Angle(0), Length(10), arcLength);
        ExpectPose(g2.Evaluate(Length(2.5)), 2.5, 0, 0);
        ExpectPose(g2.End(), 10, 0, 0);
    }

    TEST(Geometry, Poly3FollowsCubic)
    {
        Poly3Shape poly;
        poly.b = 0.5;
        Geometry g(Length(0), Length(0), Length(0), Angle(0), Length(std::sqrt(125.0)), poly);
        // v = 0.5 u is a straight line of slope 0.5
        ExpectPose(g.End(), 10, 5, std::atan(0.5));
    }

    TEST(Geometry, EvaluateOutsideSegmentThrows)
    {
        Geometry line(Length(0), Length(0), Length(0), Angle(0), Length(10), LineShape{});
        EXPECT_THROW(line.Evaluate(Length(10.5)), GeometryError);
        EXPECT_THROW(line.Evaluate(Length(-0.1)), GeometryError);
        try
        {
            line.Evaluate(Length(11));
            FAIL();
        }
        catch (const GeometryError& e)
        {
            EXPECT_EQ(e.Kind(), ErrorKind::OffsetOutOfRange);
        }
    }

    TEST(Geometry, InvalidConstructionIsABug)
    {
        EXPECT_THROW(Geometry(Length(-1), Length(0), Length(0), Angle(0), Length(10), LineShape{}), std::invalid_argument);
        EXPECT_THROW(Geometry(Length(0), Length(0), Length(0), Angle(0), Length(-10), LineShape{}), std::invalid_argument);
    }

    TEST(Geometry, ShapeElementNames)
    {
        EXPECT_STREQ(ShapeElementName(LineShape{}), "line");
        EXPECT_STREQ(ShapeElementName(ArcShape{}), "arc");
        EXPECT_STREQ(ShapeElementName(SpiralShape{}), "spiral");
        EXPECT_STREQ(ShapeElementName(Poly3Shape{}), "poly3");
        EXPECT_STREQ(ShapeElementName(ParamPoly3Shape{}), "paramPoly3");
    }

    TEST(Geometry, EveryShapeLeavesTheStraightLine)
    {
        const double length = 10;
        Poly3Shape poly;
        poly.c = 0.01;
        ParamPoly3Shape param;
        param.bU = length;
        param.cV = 1;
        const std::vector<GeometryShape> shapes = {
            ArcShape{ Curvature(0.05) }, SpiralShape{ Curvature(0), Curvature(0.05) }, poly, param };

        for (const auto& shape : shapes)
        {
            Geometry g(Length(0), Length(0), Length(0), Angle(0), Length(length), shape);
            auto end = g.End();
            EXPECT_GT(end.y.Value(), 0.1) << ShapeElementName(shape);
            EXPECT_GT(end.hdg.Value(), 0.01) << ShapeElementName(shape);
        }
    }

    TEST(Geometry, RoadEvaluateAcrossSegments)
    {
        Road road;
        road.id = "1";
        road.planView.emplace_back(Length(0), Length(0), Length(0), Angle(0), Length(10), LineShape{});
        road.planView.emplace_back(Length(10), Length(10), Length(0), Angle(Pi / 2), Length(5), LineShape{});
        road.length = Length(15);

        ExpectPose(road.Evaluate(Length(5)), 5, 0, 0);
        // The later segment owns a shared boundary
        ExpectPose(road.Evaluate(Length(10)), 10, 0, Pi / 2);
        ExpectPose(road.Evaluate(Length(12)), 10, 2, Pi / 2);
        ExpectPose(road.Evaluate(Length(15)), 10, 5, Pi / 2);
        EXPECT_EQ(&road.GeometryAt(Length(3)), &road.planView[0]);
        EXPECT_EQ(&road.GeometryAt(Length(14)), &road.planView[1]);
        EXPECT_THROW(road.Evaluate(Length(15.5)), GeometryError);
    }
}
