#include "reader_detail.h"

namespace
{
    using namespace XodrCodec;

    SwitchTrack ReadSwitchTrack(ReadContext& ctx)
    {
        SwitchTrack rtn;
        rtn.id = ctx.RequiredID("id");
        rtn.s = ctx.RequiredLength("s", Domain::NonNegative);
        rtn.dir = ctx.RequiredEnum<ElementDir>("dir");
        return rtn;
    }

    RailroadSwitch ReadSwitch(ReadContext& ctx)
    {
        RailroadSwitch rtn;
        rtn.name = ctx.RequiredString("name");
        rtn.id = ctx.RequiredID("id");
        rtn.position = ctx.RequiredEnum<SwitchPosition>("position");

        bool mainSeen = false, sideSeen = false;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (Is(child, "mainTrack"))
            {
                if (ctx.FirstOccurrence(child, mainSeen))
                {
                    mainSeen = true;
                    rtn.mainTrack = ReadSwitchTrack(child);
                }
            }
            else if (Is(child, "sideTrack"))
            {
                if (ctx.FirstOccurrence(child, sideSeen))
                {
                    sideSeen = true;
                    rtn.sideTrack = ReadSwitchTrack(child);
                }
            }
            else if (Is(child, "partner"))
            {
                if (ctx.FirstOccurrence(child, rtn.partner.has_value()))
                {
                    rtn.partner = SwitchPartner{ child.RequiredID("id"), child.OptionalString("name") };
                }
            }
            else
            {
                return false;
            }
            return true;
        }, &rtn.extra);

        if (!mainSeen)
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "mainTrack", "");
        }
        if (!sideSeen)
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "sideTrack", "");
        }
        return rtn;
    }

    PlatformSegment ReadSegment(ReadContext& ctx)
    {
        PlatformSegment rtn;
        rtn.roadId = ctx.RequiredID("roadId");
        rtn.sStart = ctx.RequiredLength("sStart", Domain::NonNegative);
        rtn.sEnd = ctx.RequiredLength("sEnd", Domain::NonNegative);
        rtn.side = ctx.RequiredEnum<SegmentSide>("side");
        return rtn;
    }

    Platform ReadPlatform(ReadContext& ctx)
    {
        Platform rtn;
        rtn.id = ctx.RequiredID("id");
        rtn.name = ctx.OptionalString("name");
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "segment"))
            {
                return false;
            }
            rtn.segments.push_back(ReadSegment(child));
            return true;
        }, &rtn.extra);
        if (rtn.segments.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "segment", "", "platform requires at least one segment");
        }
        return rtn;
    }
}

namespace XodrCodec
{
    Railroad ReadRailroad(ReadContext& ctx)
    {
        Railroad rtn;
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "switch"))
            {
                return false;
            }
            rtn.switches.push_back(ReadSwitch(child));
            return true;
        }, &rtn.extra);
        return rtn;
    }

    Station ReadStation(ReadContext& ctx)
    {
        Station rtn;
        rtn.name = ctx.RequiredString("name");
        rtn.id = ctx.RequiredID("id");
        rtn.type = ctx.OptionalEnum<StationType>("type");
        ctx.ForEachChild([&](ReadContext& child)
        {
            if (!Is(child, "platform"))
            {
                return false;
            }
            rtn.platforms.push_back(ReadPlatform(child));
            return true;
        }, &rtn.extra);
        if (rtn.platforms.empty())
        {
            ctx.Fail(ErrorKind::MissingRequiredField, "platform", "", "station requires at least one platform");
        }
        return rtn;
    }
}
