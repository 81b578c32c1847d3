#include "validation.h"
#include "test_const.h"

#include "reader.h"
#include "writer.h"
#include "structure.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <iterator>
#include <set>

#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

namespace XodrCodecTest
{
    void Validation::VerifyRoundTrip(const XodrCodec::Document& doc, const XodrCodec::Workarounds& workarounds)
    {
        const auto text = XodrCodec::Serialize(doc, workarounds);
        XodrCodec::ReadOptions options;
        options.workarounds = workarounds;
        const auto parsed = XodrCodec::Parse(text, options);

        ExpectOrAssert(parsed == doc);
        ExpectOrAssert(parsed.roads.size() == doc.roads.size());
        for (size_t i = 0; i != parsed.roads.size() && i != doc.roads.size(); ++i)
        {
            if (parsed.roads[i] != doc.roads[i])
            {
                spdlog::error("Road {} changed over the round trip", doc.roads[i].id);
            }
            VerifySingleRoad(parsed.roads[i]);
        }

        ExpectOrAssert(XodrCodec::Serialize(parsed, workarounds) == text);
    }

    void Validation::VerifyRoundTrip(const XodrCodec::Document& doc)
    {
        VerifyRoundTrip(doc, XodrCodec::Workarounds::Strict());
    }

    void Validation::VerifySingleRoad(const XodrCodec::Road& road)
    {
        ExpectOrAssert(XodrCodec::CheckRoadStructure(road, road.id).empty());
        VerifyPlanViewContinuity(road);
        VerifyLaneSections(road);
    }

    void Validation::VerifyPlanViewContinuity(const XodrCodec::Road& road)
    {
        for (size_t i = 1; i < road.planView.size(); ++i)
        {
            auto end = road.planView[i - 1].End();
            auto start = road.planView[i].Start();
            ExpectNearOrAssert(end.x.Value(), start.x.Value(), epsilon_integral_result);
            ExpectNearOrAssert(end.y.Value(), start.y.Value(), epsilon_integral_result);
            ExpectNearOrAssert(end.hdg.Value(), start.hdg.Value(), epsilon_integral_result);
            ExpectNearOrAssert(road.planView[i - 1].EndS().Value(), road.planView[i].S().Value(), epsilon);
        }
        ExpectNearOrAssert(road.planView.back().EndS().Value(), road.length.Value(), epsilon);
    }

    void Validation::VerifyLaneSections(const XodrCodec::Road& road)
    {
        for (const auto& section : road.lanes.laneSections)
        {
            ExpectOrAssert(section.center.id == 0);
            ExpectOrAssert(section.center.shape.empty());

            std::set<int> leftIDs, rightIDs;
            for (const auto& lane : section.left)
            {
                ExpectOrAssert(lane.id > 0);
                leftIDs.insert(lane.id);
            }
            for (const auto& lane : section.right)
            {
                ExpectOrAssert(lane.id < 0);
                rightIDs.insert(lane.id);
            }
            ExpectOrAssert(leftIDs.size() == section.left.size());
            ExpectOrAssert(rightIDs.size() == section.right.size());
            if (!leftIDs.empty())
            {
                ExpectOrAssert(*leftIDs.rbegin() == static_cast<int>(leftIDs.size()));
            }
            if (!rightIDs.empty())
            {
                ExpectOrAssert(*rightIDs.begin() == -static_cast<int>(rightIDs.size()));
            }
        }
        for (size_t i = 1; i < road.lanes.laneSections.size(); ++i)
        {
            ExpectOrAssert(road.lanes.laneSections[i - 1].s <= road.lanes.laneSections[i].s);
        }
    }

    bool Validation::CompareFiles(const std::string& p1, const std::string& p2)
    {
        std::ifstream f1(p1, std::ifstream::binary);
        std::ifstream f2(p2, std::ifstream::binary);
        if (!f1 || !f2)
        {
            return false;
        }
        return std::equal(std::istreambuf_iterator<char>(f1.rdbuf()), std::istreambuf_iterator<char>(),
            std::istreambuf_iterator<char>(f2.rdbuf()), std::istreambuf_iterator<char>());
    }
}
