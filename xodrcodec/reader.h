#pragma once

#include <string>
#include <vector>

#include "document.h"
#include "workarounds.h"
#include "constants.h"

namespace XodrCodec
{
    // Non-fatal finding: unknown element / attribute, ignored duplicate
    struct Diagnostic
    {
        std::string path;
        std::string message;
        int line = 0;
    };

    struct ReadOptions
    {
        Workarounds workarounds;
        // Reject roads whose consecutive geometries do not join in position and heading
        bool verifyContinuity = false;
        double continuityTolerance = ContinuityTolerance;
        // Receives every diagnostic when not null
        std::vector<Diagnostic>* diagnostics = nullptr;
    };

    /*Throws ReadError on any document defect; a Document is only returned complete.
    * Each diagnostic is also logged at warn level.
    */
    Document Parse(const std::string& xml, const ReadOptions& options = {});

    Document ParseFile(const std::string& path, const ReadOptions& options = {});
}
