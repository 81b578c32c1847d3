#pragma once

#ifndef XODRCODEC_FUZZING
#error "arbitrary.h is only available with the XODRCODEC_FUZZING build option"
#endif

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include "document.h"
#include "enums.h"

namespace XodrCodec
{
    /*Source of structured choices. Driven either by fuzzer bytes (zeros once the
    * input is exhausted, so every byte string maps to some Document) or by a seed.
    */
    class Unstructured
    {
    public:
        Unstructured(const uint8_t* data, size_t size);

        explicit Unstructured(int seed);

        uint32_t NextU32();

        // Inclusive
        int IntBetween(int low, int hi);

        double DoubleBetween(double low, double hi);

        bool Bool() { return (NextU32() & 1) != 0; }

        // Letter followed by up to maxLength - 1 letters / digits
        std::string Identifier(int maxLength = 8);

        /*Up to maxPieces fragments, never empty: letters, spaces, XML-special characters,
        * tab, newline, "]]>" and multi-byte UTF-8. No carriage return.
        */
        std::string FreeText(int maxPieces = 8);

        template <typename E>
        E Enum()
        {
            const auto values = EnumValues<E>();
            return values[IntBetween(0, static_cast<int>(values.size()) - 1)];
        }

    private:
        uint8_t NextByte();

        const uint8_t* data = nullptr;
        size_t size = 0;
        size_t position = 0;
        bool seeded = false;
        std::mt19937 engine;
    };

    /*A Document that satisfies every per-road invariant the reader and writer enforce:
    * planView starts at 0 and chains end to start, lane sections start at 0 and are
    * ordered, lane ids are contiguous per side, profile records are s-ordered,
    * ids are well-formed and all numbers are finite.
    */
    Document ArbitraryDocument(Unstructured& u);

    Document ArbitraryDocument(int seed);
}
