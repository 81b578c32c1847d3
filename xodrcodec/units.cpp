#include "units.h"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

namespace
{
    bool IsXmlSpace(char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    bool IsDigit(char c)
    {
        return c >= '0' && c <= '9';
    }

    std::string Trimmed(const std::string& text)
    {
        size_t begin = 0, end = text.size();
        while (begin < end && IsXmlSpace(text[begin])) ++begin;
        while (end > begin && IsXmlSpace(text[end - 1])) --end;
        return text.substr(begin, end - begin);
    }

    bool IsDecimalLiteral(const std::string& t)
    {
        size_t i = 0;
        if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;

        size_t intDigits = 0, fracDigits = 0;
        while (i < t.size() && IsDigit(t[i])) { ++i; ++intDigits; }
        if (i < t.size() && t[i] == '.')
        {
            ++i;
            while (i < t.size() && IsDigit(t[i])) { ++i; ++fracDigits; }
        }
        if (intDigits + fracDigits == 0) return false;

        if (i < t.size() && (t[i] == 'e' || t[i] == 'E'))
        {
            ++i;
            if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
            size_t expDigits = 0;
            while (i < t.size() && IsDigit(t[i])) { ++i; ++expDigits; }
            if (expDigits == 0) return false;
        }
        return i == t.size();
    }
}

namespace XodrCodec
{
    NumberFault ParseNumber(const std::string& text, double& out)
    {
        auto t = Trimmed(text);
        if (!IsDecimalLiteral(t))
        {
            return NumberFault::Malformed;
        }

        errno = 0;
        char* end = nullptr;
        double v = std::strtod(t.c_str(), &end);
        if (end != t.c_str() + t.size())
        {
            return NumberFault::Malformed;
        }
        // Underflow to a denormal / zero is harmless; overflow to inf is not.
        if (errno == ERANGE && !std::isfinite(v))
        {
            return NumberFault::OutOfRange;
        }
        if (!std::isfinite(v))
        {
            return NumberFault::OutOfRange;
        }
        out = v;
        return NumberFault::None;
    }

    NumberFault ParseInteger(const std::string& text, long long& out)
    {
        auto t = Trimmed(text);
        size_t i = 0;
        if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
        if (i == t.size()) return NumberFault::Malformed;
        for (; i < t.size(); ++i)
        {
            if (!IsDigit(t[i])) return NumberFault::Malformed;
        }

        errno = 0;
        long long v = std::strtoll(t.c_str(), nullptr, 10);
        if (errno == ERANGE)
        {
            return NumberFault::OutOfRange;
        }
        out = v;
        return NumberFault::None;
    }

    std::string FormatNumber(double v)
    {
        return fmt::format("{}", v);
    }

    double SpeedToMetersPerSecond(double value, SpeedUnit unit)
    {
        switch (unit)
        {
        case SpeedUnit::MetersPerSecond:
            return value;
        case SpeedUnit::KilometersPerHour:
            return value / 3.6;
        case SpeedUnit::MilesPerHour:
            return value * 0.44704;
        }
        throw std::logic_error("Unknown speed unit");
    }
}
