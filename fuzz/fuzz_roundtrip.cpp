#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "arbitrary.h"
#include "reader.h"
#include "writer.h"

/*libFuzzer entry: bytes -> arbitrary Document -> Serialize -> Parse.
* Any difference, or an exception on a generated Document, is a finding.
*/
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    static const bool quiet = []() { spdlog::set_level(spdlog::level::err); return true; }();
    (void)quiet;

    XodrCodec::Unstructured u(data, size);
    auto doc = XodrCodec::ArbitraryDocument(u);

    auto text = XodrCodec::Serialize(doc);
    auto parsed = XodrCodec::Parse(text);
    if (parsed != doc)
    {
        throw std::logic_error("Round trip changed the document");
    }
    if (XodrCodec::Serialize(parsed) != text)
    {
        throw std::logic_error("Serialization is not idempotent");
    }
    return 0;
}
