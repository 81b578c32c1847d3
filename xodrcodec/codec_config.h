#pragma once

#include <string>
#include <vector>
#include <cereal/cereal.hpp>

#include "constants.h"
#include "reader.h"
#include "workarounds.h"

namespace XodrCodec
{
    /*Persisted codec settings (JSON). Turned into per-call option values by
    * MakeWorkarounds / MakeReadOptions; the codec itself never reads this.
    */
    struct CodecConfig
    {
        std::vector<std::string> workarounds;
        bool verifyContinuity = false;
        double continuityTolerance = ContinuityTolerance;

        template<class Archive>
        void serialize(Archive& archive)
        {
            archive(CEREAL_NVP(workarounds), CEREAL_NVP(verifyContinuity), CEREAL_NVP(continuityTolerance));
        }
    };

    // Defaults when the file does not exist; cereal::Exception on malformed content
    CodecConfig LoadCodecConfig(const std::string& path);

    void SaveCodecConfig(const CodecConfig& config, const std::string& path);

    // std::invalid_argument on an unknown workaround name
    Workarounds MakeWorkarounds(const CodecConfig& config);

    ReadOptions MakeReadOptions(const CodecConfig& config);
}
