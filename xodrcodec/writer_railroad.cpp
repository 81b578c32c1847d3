#include "writer_detail.h"

namespace
{
    using namespace XodrCodec;

    void WriteSwitchTrack(WriteContext ctx, const SwitchTrack& track)
    {
        ctx.PutID("id", track.id);
        ctx.Put("s", track.s);
        ctx.Put("dir", track.dir);
    }
}

namespace XodrCodec
{
    void WriteRailroad(WriteContext& ctx, const Railroad& railroad)
    {
        for (const auto& railSwitch : railroad.switches)
        {
            auto child = ctx.Child("switch");
            child.Put("name", railSwitch.name);
            child.PutID("id", railSwitch.id);
            child.Put("position", railSwitch.position);
            WriteSwitchTrack(child.Child("mainTrack"), railSwitch.mainTrack);
            WriteSwitchTrack(child.Child("sideTrack"), railSwitch.sideTrack);
            if (railSwitch.partner)
            {
                auto partner = child.Child("partner");
                partner.Put("name", railSwitch.partner->name);
                partner.PutID("id", railSwitch.partner->id);
            }
            child.PutExtra(railSwitch.extra);
        }
        ctx.PutExtra(railroad.extra);
    }

    void WriteStation(WriteContext& ctx, const Station& station)
    {
        ctx.Put("name", station.name);
        ctx.PutID("id", station.id);
        ctx.Put("type", station.type);
        ctx.RequireNonEmpty(station.platforms, "platform");
        for (const auto& platform : station.platforms)
        {
            auto child = ctx.Child("platform");
            child.Put("name", platform.name);
            child.PutID("id", platform.id);
            child.RequireNonEmpty(platform.segments, "segment");
            for (const auto& segment : platform.segments)
            {
                auto entry = child.Child("segment");
                entry.PutID("roadId", segment.roadId);
                entry.Put("sStart", segment.sStart);
                entry.Put("sEnd", segment.sEnd);
                entry.Put("side", segment.side);
            }
            child.PutExtra(platform.extra);
        }
        ctx.PutExtra(station.extra);
    }
}
