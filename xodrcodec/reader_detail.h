#pragma once

#include "read_context.h"
#include "document.h"
#include "structure.h"

#include <cstring>

// Element mappers shared between the reader translation units
namespace XodrCodec
{
    inline bool Is(const ReadContext& ctx, const char* name)
    {
        return std::strcmp(ctx.Name(), name) == 0;
    }

    Road ReadRoad(ReadContext& ctx);

    Lanes ReadLanes(ReadContext& ctx);

    Junction ReadJunction(ReadContext& ctx);

    JunctionGroup ReadJunctionGroup(ReadContext& ctx);

    Railroad ReadRailroad(ReadContext& ctx);

    Station ReadStation(ReadContext& ctx);

    LaneValidity ReadValidity(ReadContext& ctx);

    // <elevation s a b c d/> and friends
    CubicRecord ReadCubicRecord(ReadContext& ctx);

    // Throws the first violation as InvalidStructure
    void ThrowIfViolated(const ReadContext& ctx, const std::vector<StructureViolation>& violations);
}
