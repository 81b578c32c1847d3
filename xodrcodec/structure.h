#pragma once

#include <string>
#include <vector>

#include "road.h"
#include "constants.h"

namespace XodrCodec
{
    struct StructureViolation
    {
        std::string path;   // element path, rooted at the path handed in
        std::string field;
        std::string raw;
        std::string message;
    };

    // Non-empty, no leading / trailing whitespace
    bool IsWellFormedID(const std::string& id);

    /*Per-road invariants:
    * - planView non-empty, first geometry at s = 0, segments contiguous (no gap / overlap),
    *   sum of segment lengths equals road length
    * - lane sections non-empty, first at s = 0, s non-decreasing and within the road
    * - per lane section: center lane id 0 without width / border, left ids 1..n,
    *   right ids -1..-n, no duplicates, per-lane records ordered by sOffset
    * - s-ordered profile records (type, elevation, superelevation, shape, laneOffset)
    */
    std::vector<StructureViolation> CheckRoadStructure(const Road& road, const std::string& roadPath);

    std::vector<StructureViolation> CheckLaneSection(const LaneSection& section, const std::string& sectionPath);

    // Mismatch between the end of planView[index] and the declared start of planView[index + 1]
    struct GeometryDiscontinuity
    {
        size_t index;
        double positionGap;
        double headingGap;
    };

    std::vector<GeometryDiscontinuity> FindGeometryDiscontinuities(const Road& road,
        double tolerance = ContinuityTolerance);
}
