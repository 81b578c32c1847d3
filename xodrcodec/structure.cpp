#include "structure.h"
#include "units.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <variant>

#include <fmt/format.h>

namespace
{
    using namespace XodrCodec;

    double Tolerance(double magnitude)
    {
        return SequenceEpsilon * std::max(1.0, std::abs(magnitude));
    }

    bool IsXmlSpace(char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    template <typename Record, typename GetS>
    void CheckOrdered(const std::vector<Record>& records, const std::string& path, const char* element,
        GetS getS, std::vector<StructureViolation>& out, const char* field = "s")
    {
        for (size_t i = 1; i < records.size(); ++i)
        {
            double prev = getS(records[i - 1]);
            double curr = getS(records[i]);
            if (curr < prev - Tolerance(prev))
            {
                out.push_back(StructureViolation{ fmt::format("{}.{}[{}]", path, element, i), field,
                    FormatNumber(curr), fmt::format("{} decreases from {}", field, FormatNumber(prev)) });
            }
        }
    }

    template <typename Record>
    void CheckOffsetsOrdered(const std::vector<Record>& records, const std::string& lanePath, const char* element,
        std::vector<StructureViolation>& out)
    {
        CheckOrdered(records, lanePath, element, [](const Record& r) { return r.sOffset.Value(); }, out, "sOffset");
    }

    // width and border records share one sOffset sequence
    void CheckLaneRecords(const Lane& lane, const std::string& lanePath, std::vector<StructureViolation>& out)
    {
        CheckOrdered(lane.shape, lanePath, "width", [](const LaneShapeRecord& r)
        {
            return std::visit([](const auto& record) { return record.sOffset.Value(); }, r);
        }, out, "sOffset");
        CheckOffsetsOrdered(lane.roadMarks, lanePath, "roadMark", out);
        CheckOffsetsOrdered(lane.materials, lanePath, "material", out);
        CheckOffsetsOrdered(lane.speeds, lanePath, "speed", out);
        CheckOffsetsOrdered(lane.accesses, lanePath, "access", out);
        CheckOffsetsOrdered(lane.heights, lanePath, "height", out);
        CheckOffsetsOrdered(lane.rules, lanePath, "rule", out);
    }

    void CheckSide(const std::vector<Lane>& lanes, int sign, const std::string& sectionPath,
        const char* side, std::vector<StructureViolation>& out)
    {
        std::set<int> seen;
        for (size_t i = 0; i != lanes.size(); ++i)
        {
            const int id = lanes[i].id;
            const auto lanePath = fmt::format("{}.{}.lane[{}]", sectionPath, side, i);
            if (!seen.insert(id).second)
            {
                out.push_back(StructureViolation{ lanePath, "id", std::to_string(id),
                    fmt::format("duplicate lane id in {}", side) });
                continue;
            }
            if (id * sign <= 0)
            {
                out.push_back(StructureViolation{ lanePath, "id", std::to_string(id),
                    fmt::format("{} lane id must be {}", side, sign > 0 ? "positive" : "negative") });
            }
            CheckLaneRecords(lanes[i], lanePath, out);
        }

        const int n = static_cast<int>(lanes.size());
        for (int id : seen)
        {
            if (id * sign > n)
            {
                out.push_back(StructureViolation{ fmt::format("{}.{}", sectionPath, side), "id",
                    std::to_string(id), fmt::format("{} lane ids are not contiguous from the center", side) });
                break;
            }
        }
    }
}

namespace XodrCodec
{
    bool IsWellFormedID(const std::string& id)
    {
        return !id.empty() && !IsXmlSpace(id.front()) && !IsXmlSpace(id.back());
    }

    std::vector<StructureViolation> CheckLaneSection(const LaneSection& section, const std::string& sectionPath)
    {
        std::vector<StructureViolation> rtn;
        if (section.center.id != 0)
        {
            rtn.push_back(StructureViolation{ sectionPath + ".center.lane", "id",
                std::to_string(section.center.id), "center lane id must be 0" });
        }
        if (!section.center.shape.empty())
        {
            rtn.push_back(StructureViolation{ sectionPath + ".center.lane", "width", "",
                "center lane has no width or border" });
        }
        CheckLaneRecords(section.center, sectionPath + ".center.lane", rtn);
        CheckSide(section.left, 1, sectionPath, "left", rtn);
        CheckSide(section.right, -1, sectionPath, "right", rtn);
        return rtn;
    }

    std::vector<StructureViolation> CheckRoadStructure(const Road& road, const std::string& roadPath)
    {
        std::vector<StructureViolation> rtn;
        const double roadLength = road.length.Value();

        if (road.planView.empty())
        {
            rtn.push_back(StructureViolation{ roadPath + ".planView", "geometry", "",
                "reference line requires at least one geometry" });
        }
        else
        {
            const double firstS = road.planView.front().S().Value();
            if (std::abs(firstS) > Tolerance(0))
            {
                rtn.push_back(StructureViolation{ roadPath + ".planView.geometry[0]", "s",
                    FormatNumber(firstS), "reference line must start at s=0" });
            }
            for (size_t i = 1; i < road.planView.size(); ++i)
            {
                const double expected = road.planView[i - 1].EndS().Value();
                const double actual = road.planView[i].S().Value();
                if (std::abs(actual - expected) > Tolerance(expected))
                {
                    rtn.push_back(StructureViolation{ fmt::format("{}.planView.geometry[{}]", roadPath, i), "s",
                        FormatNumber(actual), fmt::format("{} after previous segment ending at s={}",
                            actual > expected ? "gap" : "overlap", FormatNumber(expected)) });
                }
            }
            const double end = road.planView.back().EndS().Value();
            if (std::abs(end - roadLength) > Tolerance(roadLength))
            {
                rtn.push_back(StructureViolation{ roadPath, "length", FormatNumber(roadLength),
                    fmt::format("reference line ends at s={}", FormatNumber(end)) });
            }
        }

        const auto& sections = road.lanes.laneSections;
        if (sections.empty())
        {
            rtn.push_back(StructureViolation{ roadPath + ".lanes", "laneSection", "",
                "lanes require at least one laneSection" });
        }
        else
        {
            const double firstS = sections.front().s.Value();
            if (std::abs(firstS) > Tolerance(0))
            {
                rtn.push_back(StructureViolation{ roadPath + ".lanes.laneSection[0]", "s",
                    FormatNumber(firstS), "first laneSection must start at s=0" });
            }
            CheckOrdered(sections, roadPath + ".lanes", "laneSection",
                [](const LaneSection& l) { return l.s.Value(); }, rtn);
            const double lastS = sections.back().s.Value();
            if (lastS > roadLength + Tolerance(roadLength))
            {
                rtn.push_back(StructureViolation{ fmt::format("{}.lanes.laneSection[{}]", roadPath, sections.size() - 1),
                    "s", FormatNumber(lastS), "laneSection starts beyond road end" });
            }
            for (size_t i = 0; i != sections.size(); ++i)
            {
                auto sectionViolations = CheckLaneSection(sections[i],
                    fmt::format("{}.lanes.laneSection[{}]", roadPath, i));
                rtn.insert(rtn.end(), sectionViolations.begin(), sectionViolations.end());
            }
        }

        auto cubicS = [](const CubicRecord& r) { return r.s.Value(); };
        CheckOrdered(road.lanes.laneOffsets, roadPath + ".lanes", "laneOffset", cubicS, rtn);
        CheckOrdered(road.types, roadPath, "type", [](const RoadTypeRecord& r) { return r.s.Value(); }, rtn);
        if (road.elevationProfile)
        {
            CheckOrdered(road.elevationProfile->elevations, roadPath + ".elevationProfile", "elevation", cubicS, rtn);
        }
        if (road.lateralProfile)
        {
            CheckOrdered(road.lateralProfile->superelevations, roadPath + ".lateralProfile", "superelevation", cubicS, rtn);
            CheckOrdered(road.lateralProfile->shapes, roadPath + ".lateralProfile", "shape",
                [](const LateralShape& r) { return r.s.Value(); }, rtn);
        }
        return rtn;
    }

    std::vector<GeometryDiscontinuity> FindGeometryDiscontinuities(const Road& road, double tolerance)
    {
        std::vector<GeometryDiscontinuity> rtn;
        for (size_t i = 1; i < road.planView.size(); ++i)
        {
            const auto end = road.planView[i - 1].End();
            const auto start = road.planView[i].Start();
            const double positionGap = std::hypot(end.x.Value() - start.x.Value(), end.y.Value() - start.y.Value());
            const double headingGap = std::abs(std::remainder(end.hdg.Value() - start.hdg.Value(), 2 * Pi));
            if (positionGap > tolerance || headingGap > tolerance)
            {
                rtn.push_back(GeometryDiscontinuity{ i - 1, positionGap, headingGap });
            }
        }
        return rtn;
    }
}
