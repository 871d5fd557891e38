#include "arbor/Args.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace arbor
{
    namespace
    {
        bool isDecimal(const std::string &text)
        {
            if (text.empty())
                return false;
            for (const char c : text)
            {
                if (c < '0' || c > '9')
                    return false;
            }
            return true;
        }

        bool parseUnsigned(const std::string &text, unsigned long long &out)
        {
            // stoull accepts a sign and leading blanks, so check the digits first
            if (!isDecimal(text))
                return false;
            try
            {
                out = std::stoull(text);
                return true;
            }
            catch (const std::out_of_range &)
            {
                return false;
            }
        }
    } // namespace

    bool parseSeed(const std::string &text, uint32_t &out)
    {
        unsigned long long value = 0;
        if (!parseUnsigned(text, value) || value > std::numeric_limits<uint32_t>::max())
            return false;
        out = static_cast<uint32_t>(value);
        return true;
    }

    bool parseTickLimit(const std::string &text, uint64_t &out)
    {
        unsigned long long value = 0;
        if (!parseUnsigned(text, value))
            return false;
        out = static_cast<uint64_t>(value);
        return true;
    }

    bool parseExtent(const std::string &text, double &out)
    {
        try
        {
            size_t       used  = 0;
            const double value = std::stod(text, &used);
            if (used != text.size() || !std::isfinite(value) || value <= 0.0)
                return false;
            out = value;
            return true;
        }
        catch (const std::logic_error &)
        {
            return false;
        }
    }
} // namespace arbor
