#pragma once
#include <string>

namespace arbor
{
    class Rng;

    struct GrowthConfig
    {
        int    seedCount       = 5;
        double pBifurcation    = 0.035; // per line, per tick
        double expiryThreshold = 0.0005; // expiry chance per generation, per tick
    };

    struct StyleConfig
    {
        double maxRectWidth     = 50.0;
        double rectBaseHue      = 180.0;
        double rectSaturation   = 60.0;
        double rectHueVariation = 50.0;
        double rectAlpha        = 0.5;
        double rectLightness    = 45.0;
        double lineDarkness     = 0.5;
        bool   pencilHorizontal = false;
        bool   useGradients     = true;
    };

    struct RunConfig
    {
        GrowthConfig growth;
        StyleConfig  style;
    };

    // Draws a complete run configuration from the stream. The draw order is fixed so a seed
    // always reproduces the same configuration and leaves the stream in the same state.
    RunConfig randomRunConfig(Rng &rng);

    class ConfigLoader
    {
        public:
            // Overrides fields of `config` with the keys present in a JSON document:
            // { "growth": { "seed_count", "p_bifurcation", "expiry_threshold" },
            //   "style":  { "max_rect_width", "rect_base_hue", ... } }
            static bool loadFromFile(const std::string &filepath, RunConfig &config);
            static bool loadFromString(const std::string &text, RunConfig &config,
                                       const std::string &source = "<string>");

            // Command line path if readable, then data/config/arbor.json, else empty.
            static std::string findConfigFile(const std::string &cmdLinePath);
    };
} // namespace arbor
