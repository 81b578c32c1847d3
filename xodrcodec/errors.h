#pragma once

#include <stdexcept>
#include <string>

namespace XodrCodec
{
    enum class ErrorKind
    {
        MalformedXml,
        MissingRequiredField,
        InvalidEnumValue,
        MalformedNumber,
        ValueOutOfDomain,
        UnresolvedReference,
        OffsetOutOfRange,
        UnsupportedVersion,
        InvalidStructure
    };

    const char* ToString(ErrorKind kind);

    /*Document defect: carries enough context to locate it.
    * path: element path such as OpenDRIVE.road[2].planView.geometry[0]
    * field: attribute or child name, may be empty
    * raw: offending text as found in (or destined for) the document
    * line: 1-based, 0 when unknown
    */
    class CodecError : public std::runtime_error
    {
    public:
        CodecError(ErrorKind kind, std::string path, std::string field,
            std::string raw, int line, const std::string& detail);

        ErrorKind Kind() const { return kind; }
        const std::string& Path() const { return path; }
        const std::string& Field() const { return field; }
        const std::string& Raw() const { return raw; }
        int Line() const { return line; }

    private:
        ErrorKind kind;
        std::string path;
        std::string field;
        std::string raw;
        int line;
    };

    class ReadError : public CodecError
    {
    public:
        using CodecError::CodecError;
    };

    class WriteError : public CodecError
    {
    public:
        using CodecError::CodecError;
    };

    class GeometryError : public CodecError
    {
    public:
        GeometryError(double offset, double length);
    };
}
