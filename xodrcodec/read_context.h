#pragma once

#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "reader.h"
#include "errors.h"
#include "enums.h"
#include "units.h"
#include "additional_data.h"

namespace XodrCodec
{
    // State shared by all element contexts of one Parse() call
    class ReadSession
    {
    public:
        ReadSession(const std::string& source, const ReadOptions& options);

        int LineOf(ptrdiff_t offset) const;

        void Report(const std::string& path, const std::string& message, int line);

        const ReadOptions& Options() const { return options; }
        const Workarounds& GetWorkarounds() const { return options.workarounds; }
        size_t DiagnosticCount() const { return diagnosticCount; }

    private:
        const ReadOptions& options;
        std::vector<size_t> lineStarts;
        size_t diagnosticCount = 0;
    };

    enum class Domain
    {
        Any,
        NonNegative
    };

    /*One element being mapped. Attribute accessors mark the attribute as understood;
    * Finish() reports the rest as diagnostics.
    */
    class ReadContext
    {
    public:
        ReadContext(pugi::xml_node node, std::string path, ReadSession& session);

        const std::string& Path() const { return path; }
        const char* Name() const { return node.name(); }
        int Line() const;
        ReadSession& Session() const { return session; }
        const Workarounds& GetWorkarounds() const { return session.GetWorkarounds(); }

        [[noreturn]] void Fail(ErrorKind kind, const std::string& field,
            const std::string& raw, const std::string& detail = "") const;

        // Presence check without consuming
        bool Has(const char* name) const;

        std::optional<std::string> OptionalString(const char* name);
        std::string RequiredString(const char* name);

        // Ids must be non-empty without surrounding whitespace (UnresolvedReference otherwise)
        std::string RequiredID(const char* name);
        std::optional<std::string> OptionalID(const char* name);

        double RequiredNumber(const char* name, Domain domain = Domain::Any);
        std::optional<double> OptionalNumber(const char* name, Domain domain = Domain::Any);

        Length RequiredLength(const char* name, Domain domain = Domain::Any)
        {
            return Length(RequiredNumber(name, domain));
        }
        std::optional<Length> OptionalLength(const char* name, Domain domain = Domain::Any);
        Angle RequiredAngle(const char* name) { return Angle(RequiredNumber(name)); }
        std::optional<Angle> OptionalAngle(const char* name);
        Curvature RequiredCurvature(const char* name) { return Curvature(RequiredNumber(name)); }

        int RequiredInt(const char* name);
        std::optional<unsigned> OptionalUnsigned(const char* name);
        unsigned RequiredUnsigned(const char* name);

        // xs:boolean: true, false, 1, 0
        std::optional<bool> OptionalBool(const char* name);
        bool DefaultedBool(const char* name, bool byDefault)
        {
            return OptionalBool(name).value_or(byDefault);
        }

        // t_yesNo
        std::optional<bool> OptionalYesNo(const char* name);
        bool RequiredYesNo(const char* name);

        template <typename E>
        std::optional<E> OptionalEnum(const char* name)
        {
            auto raw = OptionalString(name);
            if (!raw)
            {
                return std::nullopt;
            }
            E value{};
            if (!EnumFromString(*raw, value))
            {
                Fail(ErrorKind::InvalidEnumValue, name, *raw, std::string("not a value of ") + EnumTypeName<E>());
            }
            return value;
        }

        template <typename E>
        E RequiredEnum(const char* name)
        {
            if (!Has(name))
            {
                Fail(ErrorKind::MissingRequiredField, name, "");
            }
            return *OptionalEnum<E>(name);
        }

        template <typename E>
        E DefaultedEnum(const char* name, E byDefault)
        {
            return OptionalEnum<E>(name).value_or(byDefault);
        }

        // Character data (pcdata or cdata) of the element
        std::string Text() const;

        /*Visits element children in document order. handler(ReadContext&) returns false for
        * children it does not know; those become additional data when extra is given and the
        * child is an extension element, a diagnostic otherwise. Handled children are Finish()ed.
        */
        template <typename Handler>
        void ForEachChild(Handler handler, AdditionalData* extra = nullptr)
        {
            std::map<std::string, int> seen;
            for (pugi::xml_node child : node.children())
            {
                if (child.type() != pugi::node_element)
                {
                    continue;
                }
                const std::string name = child.name();
                const int index = seen[name]++;
                ReadContext childContext(child, path + "." + name + "[" + std::to_string(index) + "]", session);
                if (handler(childContext))
                {
                    childContext.Finish();
                    continue;
                }
                if (extra != nullptr && ReadExtension(childContext, *extra))
                {
                    continue;
                }
                session.Report(childContext.Path(), "unknown element <" + name + "> ignored", childContext.Line());
            }
        }

        // Reports and skips a repeated singleton child; returns true on the first occurrence
        bool FirstOccurrence(ReadContext& child, bool alreadySeen);

        // Reports attributes nobody asked for
        void Finish();

    private:
        static bool ReadExtension(ReadContext& child, AdditionalData& extra);

        pugi::xml_attribute Attribute(const char* name);

        pugi::xml_node node;
        std::string path;
        ReadSession& session;
        std::vector<std::string> consumed;
        bool skipped = false;
    };

    OpaqueElement ReadOpaque(pugi::xml_node node);
}
