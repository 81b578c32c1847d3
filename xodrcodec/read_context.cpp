#include "read_context.h"
#include "structure.h"

#include <algorithm>
#include <cstdint>

#include <spdlog/spdlog.h>

namespace XodrCodec
{
    ReadSession::ReadSession(const std::string& source, const ReadOptions& opts) :
        options(opts)
    {
        lineStarts.push_back(0);
        for (size_t i = 0; i != source.size(); ++i)
        {
            if (source[i] == '\n')
            {
                lineStarts.push_back(i + 1);
            }
        }
    }

    int ReadSession::LineOf(ptrdiff_t offset) const
    {
        if (offset < 0)
        {
            return 0;
        }
        auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), static_cast<size_t>(offset));
        return static_cast<int>(it - lineStarts.begin());
    }

    void ReadSession::Report(const std::string& path, const std::string& message, int line)
    {
        ++diagnosticCount;
        spdlog::warn("{} (line {}): {}", path, line, message);
        if (options.diagnostics != nullptr)
        {
            options.diagnostics->push_back(Diagnostic{ path, message, line });
        }
    }

    ReadContext::ReadContext(pugi::xml_node n, std::string p, ReadSession& s) :
        node(n), path(std::move(p)), session(s)
    {
    }

    int ReadContext::Line() const
    {
        return session.LineOf(node.offset_debug());
    }

    void ReadContext::Fail(ErrorKind kind, const std::string& field,
        const std::string& raw, const std::string& detail) const
    {
        throw ReadError(kind, path, field, raw, Line(), detail);
    }

    bool ReadContext::Has(const char* name) const
    {
        return static_cast<bool>(node.attribute(name));
    }

    pugi::xml_attribute ReadContext::Attribute(const char* name)
    {
        auto attr = node.attribute(name);
        if (attr)
        {
            consumed.emplace_back(name);
        }
        return attr;
    }

    std::optional<std::string> ReadContext::OptionalString(const char* name)
    {
        auto attr = Attribute(name);
        if (!attr)
        {
            return std::nullopt;
        }
        return std::string(attr.value());
    }

    std::string ReadContext::RequiredString(const char* name)
    {
        auto value = OptionalString(name);
        if (!value)
        {
            Fail(ErrorKind::MissingRequiredField, name, "");
        }
        return *value;
    }

    std::optional<std::string> ReadContext::OptionalID(const char* name)
    {
        auto value = OptionalString(name);
        if (value && !IsWellFormedID(*value))
        {
            Fail(ErrorKind::UnresolvedReference, name, *value, "malformed id");
        }
        return value;
    }

    std::string ReadContext::RequiredID(const char* name)
    {
        if (!Has(name))
        {
            Fail(ErrorKind::MissingRequiredField, name, "");
        }
        return *OptionalID(name);
    }

    std::optional<double> ReadContext::OptionalNumber(const char* name, Domain domain)
    {
        auto raw = OptionalString(name);
        if (!raw)
        {
            return std::nullopt;
        }
        double value = 0;
        switch (ParseNumber(*raw, value))
        {
        case NumberFault::Malformed:
            Fail(ErrorKind::MalformedNumber, name, *raw);
        case NumberFault::OutOfRange:
            Fail(ErrorKind::MalformedNumber, name, *raw, "magnitude out of range");
        case NumberFault::None:
            break;
        }
        if (domain == Domain::NonNegative && value < 0)
        {
            Fail(ErrorKind::ValueOutOfDomain, name, *raw, "must not be negative");
        }
        return value;
    }

    double ReadContext::RequiredNumber(const char* name, Domain domain)
    {
        if (!Has(name))
        {
            Fail(ErrorKind::MissingRequiredField, name, "");
        }
        return *OptionalNumber(name, domain);
    }

    std::optional<Length> ReadContext::OptionalLength(const char* name, Domain domain)
    {
        auto value = OptionalNumber(name, domain);
        if (!value)
        {
            return std::nullopt;
        }
        return Length(*value);
    }

    std::optional<Angle> ReadContext::OptionalAngle(const char* name)
    {
        auto value = OptionalNumber(name);
        if (!value)
        {
            return std::nullopt;
        }
        return Angle(*value);
    }

    int ReadContext::RequiredInt(const char* name)
    {
        auto raw = RequiredString(name);
        long long value = 0;
        if (ParseInteger(raw, value) != NumberFault::None)
        {
            Fail(ErrorKind::MalformedNumber, name, raw, "expected an integer");
        }
        if (value < INT32_MIN || value > INT32_MAX)
        {
            Fail(ErrorKind::ValueOutOfDomain, name, raw, "integer out of range");
        }
        return static_cast<int>(value);
    }

    std::optional<unsigned> ReadContext::OptionalUnsigned(const char* name)
    {
        auto raw = OptionalString(name);
        if (!raw)
        {
            return std::nullopt;
        }
        long long value = 0;
        if (ParseInteger(*raw, value) != NumberFault::None)
        {
            Fail(ErrorKind::MalformedNumber, name, *raw, "expected an integer");
        }
        if (value < 0 || value > UINT32_MAX)
        {
            Fail(ErrorKind::ValueOutOfDomain, name, *raw, "expected a non-negative integer");
        }
        return static_cast<unsigned>(value);
    }

    unsigned ReadContext::RequiredUnsigned(const char* name)
    {
        if (!Has(name))
        {
            Fail(ErrorKind::MissingRequiredField, name, "");
        }
        return *OptionalUnsigned(name);
    }

    std::optional<bool> ReadContext::OptionalBool(const char* name)
    {
        auto raw = OptionalString(name);
        if (!raw)
        {
            return std::nullopt;
        }
        if (*raw == "true" || *raw == "1") return true;
        if (*raw == "false" || *raw == "0") return false;
        Fail(ErrorKind::InvalidEnumValue, name, *raw, "not a value of xs:boolean");
    }

    std::optional<bool> ReadContext::OptionalYesNo(const char* name)
    {
        auto raw = OptionalString(name);
        if (!raw)
        {
            return std::nullopt;
        }
        if (*raw == "yes") return true;
        if (*raw == "no") return false;
        Fail(ErrorKind::InvalidEnumValue, name, *raw, "not a value of t_yesNo");
    }

    bool ReadContext::RequiredYesNo(const char* name)
    {
        if (!Has(name))
        {
            Fail(ErrorKind::MissingRequiredField, name, "");
        }
        return *OptionalYesNo(name);
    }

    std::string ReadContext::Text() const
    {
        std::string rtn;
        for (pugi::xml_node child : node.children())
        {
            if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata)
            {
                rtn += child.value();
            }
        }
        return rtn;
    }

    bool ReadContext::FirstOccurrence(ReadContext& child, bool alreadySeen)
    {
        if (alreadySeen)
        {
            child.skipped = true;
            session.Report(child.Path(), std::string("repeated <") + child.Name() + "> ignored", child.Line());
            return false;
        }
        return true;
    }

    void ReadContext::Finish()
    {
        if (skipped)
        {
            return;
        }
        for (pugi::xml_attribute attr : node.attributes())
        {
            if (std::find(consumed.begin(), consumed.end(), attr.name()) == consumed.end())
            {
                session.Report(path, std::string("unknown attribute @") + attr.name() + " ignored", Line());
            }
        }
    }

    OpaqueElement ReadOpaque(pugi::xml_node node)
    {
        OpaqueElement rtn;
        rtn.name = node.name();
        for (pugi::xml_attribute attr : node.attributes())
        {
            rtn.attributes.emplace_back(attr.name(), attr.value());
        }
        for (pugi::xml_node child : node.children())
        {
            switch (child.type())
            {
            case pugi::node_element:
                rtn.children.push_back(ReadOpaque(child));
                break;
            case pugi::node_pcdata:
            case pugi::node_cdata:
                rtn.text += child.value();
                break;
            default:
                break;
            }
        }
        return rtn;
    }

    namespace
    {
        DataQuality ReadDataQuality(ReadContext& ctx)
        {
            DataQuality rtn;
            bool errorSeen = false, rawDataSeen = false;
            ctx.ForEachChild([&](ReadContext& child)
            {
                const std::string name = child.Name();
                if (name == "error")
                {
                    if (ctx.FirstOccurrence(child, errorSeen))
                    {
                        errorSeen = true;
                        DataQualityError error;
                        error.xyAbsolute = child.RequiredNumber("xyAbsolute");
                        error.zAbsolute = child.RequiredNumber("zAbsolute");
                        error.xyRelative = child.RequiredNumber("xyRelative");
                        error.zRelative = child.RequiredNumber("zRelative");
                        rtn.error = error;
                    }
                    return true;
                }
                if (name == "rawData")
                {
                    if (ctx.FirstOccurrence(child, rawDataSeen))
                    {
                        rawDataSeen = true;
                        RawData raw;
                        raw.date = child.RequiredString("date");
                        raw.source = child.RequiredEnum<DataSource>("source");
                        raw.sourceComment = child.OptionalString("sourceComment");
                        raw.postProcessing = child.RequiredEnum<PostProcessing>("postProcessing");
                        raw.postProcessingComment = child.OptionalString("postProcessingComment");
                        rtn.rawData = raw;
                    }
                    return true;
                }
                return false;
            });
            return rtn;
        }
    }

    bool ReadContext::ReadExtension(ReadContext& child, AdditionalData& extra)
    {
        const std::string name = child.Name();
        if (name == "include")
        {
            extra.includes.push_back(Include{ child.RequiredString("file") });
        }
        else if (name == "userData")
        {
            UserData data;
            data.code = child.RequiredString("code");
            data.value = child.OptionalString("value");
            for (pugi::xml_node content : child.node.children())
            {
                if (content.type() == pugi::node_element)
                {
                    data.content.push_back(ReadOpaque(content));
                }
            }
            extra.userData.push_back(std::move(data));
        }
        else if (name == "dataQuality")
        {
            extra.dataQuality.push_back(ReadDataQuality(child));
        }
        else
        {
            return false;
        }
        child.Finish();
        return true;
    }
}
