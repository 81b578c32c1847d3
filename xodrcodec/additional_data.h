#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "enums.h"

namespace XodrCodec
{
    /*Element subtree carried through unchanged (userData content).
    * Either text or children is expected to be populated, not both.
    */
    struct OpaqueElement
    {
        std::string name;
        std::vector<std::pair<std::string, std::string>> attributes;
        std::string text;
        std::vector<OpaqueElement> children;

        bool operator==(const OpaqueElement& o) const
        {
            return std::tie(name, attributes, text, children) ==
                std::tie(o.name, o.attributes, o.text, o.children);
        }
        bool operator!=(const OpaqueElement& o) const { return !(*this == o); }
    };

    struct UserData
    {
        std::string code;
        std::optional<std::string> value;
        std::vector<OpaqueElement> content;

        bool operator==(const UserData& o) const
        {
            return std::tie(code, value, content) == std::tie(o.code, o.value, o.content);
        }
        bool operator!=(const UserData& o) const { return !(*this == o); }
    };

    struct Include
    {
        std::string file;

        bool operator==(const Include& o) const { return file == o.file; }
        bool operator!=(const Include& o) const { return !(*this == o); }
    };

    struct DataQualityError
    {
        double xyAbsolute = 0;
        double xyRelative = 0;
        double zAbsolute = 0;
        double zRelative = 0;

        bool operator==(const DataQualityError& o) const
        {
            return std::tie(xyAbsolute, xyRelative, zAbsolute, zRelative) ==
                std::tie(o.xyAbsolute, o.xyRelative, o.zAbsolute, o.zRelative);
        }
        bool operator!=(const DataQualityError& o) const { return !(*this == o); }
    };

    struct RawData
    {
        std::string date;
        DataSource source = DataSource::Sensor;
        std::optional<std::string> sourceComment;
        PostProcessing postProcessing = PostProcessing::Raw;
        std::optional<std::string> postProcessingComment;

        bool operator==(const RawData& o) const
        {
            return std::tie(date, source, sourceComment, postProcessing, postProcessingComment) ==
                std::tie(o.date, o.source, o.sourceComment, o.postProcessing, o.postProcessingComment);
        }
        bool operator!=(const RawData& o) const { return !(*this == o); }
    };

    struct DataQuality
    {
        std::optional<DataQualityError> error;
        std::optional<RawData> rawData;

        bool operator==(const DataQuality& o) const
        {
            return std::tie(error, rawData) == std::tie(o.error, o.rawData);
        }
        bool operator!=(const DataQuality& o) const { return !(*this == o); }
    };

    // Schema extension points; written after all other children of the owning element
    struct AdditionalData
    {
        std::vector<Include> includes;
        std::vector<UserData> userData;
        std::vector<DataQuality> dataQuality;

        bool Empty() const { return includes.empty() && userData.empty() && dataQuality.empty(); }

        bool operator==(const AdditionalData& o) const
        {
            return std::tie(includes, userData, dataQuality) ==
                std::tie(o.includes, o.userData, o.dataQuality);
        }
        bool operator!=(const AdditionalData& o) const { return !(*this == o); }
    };
}
