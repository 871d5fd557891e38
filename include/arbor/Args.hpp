#pragma once
#include <cstdint>
#include <string>

namespace arbor
{
    // Command line value parsers shared by arbor and arbor_run. Each returns false
    // and leaves `out` untouched when the whole text is not a value in range.

    // Unsigned decimal that fits in 32 bits.
    bool parseSeed(const std::string &text, uint32_t &out);

    // Unsigned decimal tick count.
    bool parseTickLimit(const std::string &text, uint64_t &out);

    // Finite, strictly positive canvas extent.
    bool parseExtent(const std::string &text, double &out);
} // namespace arbor
