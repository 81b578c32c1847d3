#include "errors.h"
#include "units.h"

#include <fmt/format.h>

namespace
{
    std::string Describe(XodrCodec::ErrorKind kind, const std::string& path, const std::string& field,
        const std::string& raw, int line, const std::string& detail)
    {
        std::string message = fmt::format("{} at {}", XodrCodec::ToString(kind), path.empty() ? "<document>" : path);
        if (!field.empty())
        {
            message += fmt::format(" @{}", field);
        }
        if (line > 0)
        {
            message += fmt::format(" (line {})", line);
        }
        if (!raw.empty())
        {
            message += fmt::format(": \"{}\"", raw);
        }
        if (!detail.empty())
        {
            message += fmt::format(" - {}", detail);
        }
        return message;
    }
}

namespace XodrCodec
{
    const char* ToString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::MalformedXml: return "MalformedXml";
        case ErrorKind::MissingRequiredField: return "MissingRequiredField";
        case ErrorKind::InvalidEnumValue: return "InvalidEnumValue";
        case ErrorKind::MalformedNumber: return "MalformedNumber";
        case ErrorKind::ValueOutOfDomain: return "ValueOutOfDomain";
        case ErrorKind::UnresolvedReference: return "UnresolvedReference";
        case ErrorKind::OffsetOutOfRange: return "OffsetOutOfRange";
        case ErrorKind::UnsupportedVersion: return "UnsupportedVersion";
        case ErrorKind::InvalidStructure: return "InvalidStructure";
        }
        return "Unknown";
    }

    CodecError::CodecError(ErrorKind k, std::string p, std::string f,
        std::string r, int l, const std::string& detail) :
        std::runtime_error(Describe(k, p, f, r, l, detail)),
        kind(k), path(std::move(p)), field(std::move(f)), raw(std::move(r)), line(l)
    {
    }

    GeometryError::GeometryError(double offset, double length) :
        CodecError(ErrorKind::OffsetOutOfRange, "", "offset", FormatNumber(offset), 0,
            fmt::format("valid range is [0, {}]", FormatNumber(length)))
    {
    }
}
