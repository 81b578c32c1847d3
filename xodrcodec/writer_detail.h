#pragma once

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <pugixml.hpp>

#include "document.h"
#include "errors.h"
#include "structure.h"
#include "workarounds.h"

namespace XodrCodec
{
    /*One element being emitted. Attributes go out in call order, so callers
    * follow the schema order; child paths mirror the ones the reader reports.
    */
    class WriteContext
    {
    public:
        WriteContext(pugi::xml_node node, std::string path, const Workarounds& workarounds);

        const std::string& Path() const { return path; }
        const Workarounds& GetWorkarounds() const { return workarounds; }

        WriteContext Child(const char* name);

        [[noreturn]] void Fail(ErrorKind kind, const std::string& field,
            const std::string& raw, const std::string& detail = "") const;

        void Put(const char* name, const std::string& value);
        void Put(const char* name, const char* value);
        void Put(const char* name, double value);
        void Put(const char* name, int value);
        void Put(const char* name, unsigned value);
        // xs:boolean, written as true / false
        void Put(const char* name, bool value);

        template <typename Dim>
        void Put(const char* name, Quantity<Dim> value)
        {
            Put(name, value.Value());
        }

        template <typename E, typename std::enable_if<std::is_enum<E>::value, int>::type = 0>
        void Put(const char* name, E value)
        {
            Put(name, EnumToString(value));
        }

        template <typename T>
        void Put(const char* name, const std::optional<T>& value)
        {
            if (value)
            {
                Put(name, *value);
            }
        }

        // Optional attribute with a schema default
        template <typename T>
        void PutUnlessDefault(const char* name, const T& value, const T& byDefault)
        {
            if (value != byDefault)
            {
                Put(name, value);
            }
        }

        void PutYesNo(const char* name, bool value);

        void PutID(const char* name, const std::string& id);
        void PutID(const char* name, const std::optional<std::string>& id);

        void CData(const std::string& text);

        // include, userData, dataQuality; always the last children
        void PutExtra(const AdditionalData& extra);

        template <typename T>
        void RequireNonEmpty(const std::vector<T>& items, const char* element) const
        {
            if (items.empty())
            {
                Fail(ErrorKind::MissingRequiredField, element, "", std::string("at least one <") + element + "> required");
            }
        }

    private:
        pugi::xml_node node;
        std::string path;
        const Workarounds& workarounds;
        std::map<std::string, int> childCount;
    };

    void WriteRoad(WriteContext& ctx, const Road& road);

    void WriteLanes(WriteContext& ctx, const Lanes& lanes);

    void WriteValidity(WriteContext& ctx, const LaneValidity& validity);

    void WriteCubicRecord(WriteContext& ctx, const CubicRecord& record);

    void WriteRailroad(WriteContext& ctx, const Railroad& railroad);

    void WriteStation(WriteContext& ctx, const Station& station);
}
