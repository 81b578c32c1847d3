#pragma once

#include <string>
#include <vector>

namespace XodrCodec
{
    enum class Workaround
    {
        /*SUMO netconvert writes paramPoly3 without @pRange.
        * Reader: a missing pRange means "normalized" instead of MissingRequiredField.
        * Writer: unaffected, pRange is always written.
        */
        SumoIssue10301,
        /*SUMO treats a roadMark without @color as having no color.
        * Writer: @color is always written, even when it equals the default "standard".
        * Reader: unaffected.
        */
        SumoRoadMarkMissingColor,
        Count
    };

    const char* ToString(Workaround w);

    /*Set of enabled compatibility switches. Passed by value to every read / write call;
    * a default-constructed set is strict standard conformance.
    */
    class Workarounds
    {
    public:
        Workarounds() = default;

        static Workarounds Strict() { return Workarounds(); }
        static Workarounds Sumo();

        Workarounds& Enable(Workaround w);
        Workarounds& Disable(Workaround w);
        bool IsEnabled(Workaround w) const;

        /*Accepts "workaround-sumo-issue-10301", "workaround-sumo-roadmark-missing-color"
        * and the umbrella "workaround-sumo". Throws std::invalid_argument otherwise.
        */
        Workarounds& EnableByName(const std::string& name);

        std::vector<std::string> Names() const;

        bool operator==(const Workarounds& other) const { return flags == other.flags; }
        bool operator!=(const Workarounds& other) const { return flags != other.flags; }

    private:
        unsigned flags = 0;
    };
}
