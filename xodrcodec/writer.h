#pragma once

#include <string>

#include "document.h"
#include "workarounds.h"

namespace XodrCodec
{
    /*Emits elements and attributes in the order of the OpenDRIVE 1.7 grammar.
    * Optional fields equal to their schema default are left out (see Workarounds for exceptions).
    * Output is deterministic: an unchanged Document always serializes to the same bytes.
    * Throws WriteError for documents that cannot be represented (non-finite numbers,
    * malformed ids, empty mandatory lists, broken per-road structure).
    */
    std::string Serialize(const Document& doc, const Workarounds& workarounds = {});

    // Serialize() into a file; std::runtime_error when the file cannot be written
    void ExportFile(const Document& doc, const std::string& path, const Workarounds& workarounds = {});
}
