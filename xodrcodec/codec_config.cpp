#include "codec_config.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <cereal/archives/json.hpp>

#include <spdlog/spdlog.h>

namespace XodrCodec
{
    CodecConfig LoadCodecConfig(const std::string& path)
    {
        CodecConfig rtn;
        if (std::filesystem::exists(path))
        {
            std::ifstream inFile(path);
            cereal::JSONInputArchive iarchive(inFile);
            iarchive(rtn);
            spdlog::info("Loaded codec config from {}", path);
        }
        else
        {
            spdlog::info("No codec config at {}, using defaults", path);
        }
        return rtn;
    }

    void SaveCodecConfig(const CodecConfig& config, const std::string& path)
    {
        std::ofstream outFile(path);
        if (!outFile)
        {
            throw std::runtime_error("Cannot write " + path);
        }
        // archive flushes on destruction
        cereal::JSONOutputArchive oarchive(outFile);
        oarchive(config);
    }

    Workarounds MakeWorkarounds(const CodecConfig& config)
    {
        Workarounds rtn;
        for (const auto& name : config.workarounds)
        {
            rtn.EnableByName(name);
        }
        return rtn;
    }

    ReadOptions MakeReadOptions(const CodecConfig& config)
    {
        ReadOptions rtn;
        rtn.workarounds = MakeWorkarounds(config);
        rtn.verifyContinuity = config.verifyContinuity;
        rtn.continuityTolerance = config.continuityTolerance;
        return rtn;
    }
}
