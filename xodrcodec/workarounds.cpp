#include "workarounds.h"

#include <stdexcept>

namespace
{
    unsigned Bit(XodrCodec::Workaround w)
    {
        return 1u << static_cast<unsigned>(w);
    }
}

namespace XodrCodec
{
    const char* ToString(Workaround w)
    {
        switch (w)
        {
        case Workaround::SumoIssue10301: return "workaround-sumo-issue-10301";
        case Workaround::SumoRoadMarkMissingColor: return "workaround-sumo-roadmark-missing-color";
        default: break;
        }
        throw std::invalid_argument("Not a workaround");
    }

    Workarounds Workarounds::Sumo()
    {
        Workarounds rtn;
        rtn.Enable(Workaround::SumoIssue10301);
        rtn.Enable(Workaround::SumoRoadMarkMissingColor);
        return rtn;
    }

    Workarounds& Workarounds::Enable(Workaround w)
    {
        flags |= Bit(w);
        return *this;
    }

    Workarounds& Workarounds::Disable(Workaround w)
    {
        flags &= ~Bit(w);
        return *this;
    }

    bool Workarounds::IsEnabled(Workaround w) const
    {
        return (flags & Bit(w)) != 0;
    }

    Workarounds& Workarounds::EnableByName(const std::string& name)
    {
        if (name == "workaround-sumo")
        {
            Enable(Workaround::SumoIssue10301);
            return Enable(Workaround::SumoRoadMarkMissingColor);
        }
        for (int i = 0; i != static_cast<int>(Workaround::Count); ++i)
        {
            auto w = static_cast<Workaround>(i);
            if (name == ToString(w))
            {
                return Enable(w);
            }
        }
        throw std::invalid_argument("Unknown workaround: " + name);
    }

    std::vector<std::string> Workarounds::Names() const
    {
        std::vector<std::string> rtn;
        for (int i = 0; i != static_cast<int>(Workaround::Count); ++i)
        {
            auto w = static_cast<Workaround>(i);
            if (IsEnabled(w))
            {
                rtn.emplace_back(ToString(w));
            }
        }
        return rtn;
    }
}
