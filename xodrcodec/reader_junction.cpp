#include "reader_detail.h"

namespace
{
    using namespace XodrCodec;

    VirtualConnectionEnd ReadVirtualConnectionEnd(ReadContext& ctx)
    {
        VirtualConnectionEnd rtn;
        rtn.elementType = ctx.RequiredString("elementType");
        rtn.elementId = ctx.RequiredID("elementId");
        rtn.elementS = ctx.RequiredLength("elementS", Domain::NonNegative);
        rtn.elementDir = ctx.RequiredEnum<ElementDir>("elementDir");
        return rtn;
    }

    Connection ReadConnection(ReadContext& ctx)
    {
        Connection rtn;
        rtn.id = ctx.RequiredID("id");
        rtn.type = ctx.DefaultedEnum<ConnectionType>("type", ConnectionType::Default);
        rtn.incomingRoad = ctx.OptionalID("incomingRoad");
        rtn.connectingRoad = ctx.OptionalID("connectingRoad");
        rtn.linkedRoad = ctx.OptionalID("linkedRoad");
        rtn.contactPoint = ctx.OptionalEnum<ContactPoint>("contactPoint");

        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "predecessor"))
            {
                if (ctx.FirstOccurrence(child, rtn.predecessor.has_value()))
                {
                    rtn.predecessor = ReadVirtualConnectionEnd(child);
                }
                return true;
            }
            if (Is(child, "successor"))
            {
                if (ctx.FirstOccurrence(child, rtn.successor.has_value()))
                {
                    rtn.successor = ReadVirtualConnectionEnd(child);
                }
                return true;
            }
            if (Is(child, "laneLink"))
            {
                rtn.laneLinks.push_back(JunctionLaneLink{ child.RequiredInt("from"), child.RequiredInt("to") });
                return true;
            }
            return false;
        });
        return rtn;
    }

    JunctionSurface ReadJunctionSurface(ReadContext& ctx)
    {
        JunctionSurface rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "CRG"))
            {
                return false;
            }
            JunctionCrg crg;
            crg.file = child.RequiredString("file");
            crg.mode = child.RequiredEnum<JunctionCrgMode>("mode");
            crg.purpose = child.OptionalEnum<CrgPurpose>("purpose");
            crg.zOffset = child.OptionalLength("zOffset");
            crg.zScale = child.OptionalNumber("zScale");
            rtn.crgs.push_back(crg);
            return true;
        }, &rtn.extra);
        return rtn;
    }
}

namespace XodrCodec
{
    Junction ReadJunction(ReadContext& ctx)
    {
        Junction rtn;
        rtn.id = ctx.RequiredID("id");
        rtn.name = ctx.OptionalString("name");
        rtn.type = ctx.DefaultedEnum<JunctionType>("type", JunctionType::Default);
        rtn.mainRoad = ctx.OptionalID("mainRoad");
        rtn.orientation = ctx.OptionalEnum<Orientation>("orientation");
        rtn.sStart = ctx.OptionalLength("sStart", Domain::NonNegative);
        rtn.sEnd = ctx.OptionalLength("sEnd", Domain::NonNegative);

        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "connection"))
            {
                rtn.connections.push_back(ReadConnection(child));
            }
            else if (Is(child, "priority"))
            {
                rtn.priorities.push_back(JunctionPriority{ child.OptionalID("high"), child.OptionalID("low") });
            }
            else if (Is(child, "controller"))
            {
                JunctionController controller;
                controller.id = child.RequiredID("id");
                controller.type = child.OptionalString("type");
                controller.sequence = child.OptionalUnsigned("sequence");
                rtn.controllers.push_back(controller);
            }
            else if (Is(child, "surface"))
            {
                if (ctx.FirstOccurrence(child, rtn.surface.has_value()))
                {
                    rtn.surface = ReadJunctionSurface(child);
                }
            }
            else
            {
                return false;
            }
            return true;
        }, &rtn.extra);

        if (rtn.connections.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "connection", "", "junction requires at least one connection");
        }
        return rtn;
    }

    JunctionGroup ReadJunctionGroup(ReadContext& ctx)
    {
        JunctionGroup rtn;
        rtn.name = ctx.OptionalString("name");
        rtn.id = ctx.RequiredID("id");
        rtn.type = ctx.RequiredEnum<JunctionGroupType>("type");
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "junctionReference"))
            {
                return false;
            }
            rtn.junctionReferences.push_back(child.RequiredID("junction"));
            return true;
        }, &rtn.extra);
        if (rtn.junctionReferences.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "junctionReference", "",
                "junction group requires at least one junction reference");
        }
        return rtn;
    }
}
