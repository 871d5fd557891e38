#include "arbor/Config.hpp"
#include "arbor/Random.hpp"

#include <json/json.h>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace arbor
{
    RunConfig randomRunConfig(Rng &rng)
    {
        RunConfig c;

        c.style.useGradients = rng.next() > 0.3;

        c.growth.seedCount    = static_cast<int>(std::round(rng.next(1.0, 10.0)));
        c.growth.pBifurcation = rng.next(0.02, 0.05);

        c.style.maxRectWidth     = rng.next(0.0, 100.0);
        c.style.rectBaseHue      = rng.next(360.0);
        c.style.rectSaturation   = rng.next(20.0, 100.0);
        c.style.rectHueVariation = rng.next(100.0);
        c.style.rectAlpha        = c.style.useGradients ? rng.next(0.4, 0.8) : rng.next(0.1, 0.4);
        c.style.rectLightness    = rng.next(20.0, 70.0);

        c.growth.expiryThreshold = rng.next(0.001);

        c.style.lineDarkness     = rng.next();
        c.style.pencilHorizontal = rng.next() > 0.5;
        return c;
    }

    namespace
    {
        constexpr int kMaxSeedCount = 1000;

        void readDouble(const Json::Value &section, const char *key, double &out)
        {
            if (section.isMember(key) && section[key].isNumeric())
                out = section[key].asDouble();
        }

        void readBool(const Json::Value &section, const char *key, bool &out)
        {
            if (section.isMember(key) && section[key].isBool())
                out = section[key].asBool();
        }

        void warnProbability(const std::string &source, const char *key, const double p)
        {
            if (p < 0.0 || p > 1.0)
                std::cerr << "[config] " << source << ": " << key << "=" << p << " is outside [0,1]\n";
        }
    } // namespace

    bool ConfigLoader::loadFromString(const std::string &text, RunConfig &config, const std::string &source)
    {
        Json::Value             root;
        Json::CharReaderBuilder builder;
        std::string             errors;
        std::istringstream      stream(text);

        if (!Json::parseFromStream(builder, stream, &root, &errors))
        {
            std::cerr << "[config] JSON parse error in " << source << ": " << errors << "\n";
            return false;
        }

        if (!root.isObject())
        {
            std::cerr << "[config] " << source << ": top level must be an object\n";
            return false;
        }

        const Json::Value &growth = root["growth"];
        if (growth.isObject())
        {
            if (growth.isMember("seed_count"))
            {
                const Json::Value &count = growth["seed_count"];
                if (count.isInt() && count.asInt() <= kMaxSeedCount)
                    config.growth.seedCount = count.asInt();
                else
                    std::cerr << "[config] " << source << ": seed_count must be an integer <= " << kMaxSeedCount
                              << ", keeping " << config.growth.seedCount << "\n";
            }
            readDouble(growth, "p_bifurcation", config.growth.pBifurcation);
            readDouble(growth, "expiry_threshold", config.growth.expiryThreshold);

            warnProbability(source, "p_bifurcation", config.growth.pBifurcation);
            warnProbability(source, "expiry_threshold", config.growth.expiryThreshold);
        }

        const Json::Value &style = root["style"];
        if (style.isObject())
        {
            readDouble(style, "max_rect_width", config.style.maxRectWidth);
            readDouble(style, "rect_base_hue", config.style.rectBaseHue);
            readDouble(style, "rect_saturation", config.style.rectSaturation);
            readDouble(style, "rect_hue_variation", config.style.rectHueVariation);
            readDouble(style, "rect_alpha", config.style.rectAlpha);
            readDouble(style, "rect_lightness", config.style.rectLightness);
            readDouble(style, "line_darkness", config.style.lineDarkness);
            readBool(style, "pencil_horizontal", config.style.pencilHorizontal);
            readBool(style, "use_gradients", config.style.useGradients);
        }

        return true;
    }

    bool ConfigLoader::loadFromFile(const std::string &filepath, RunConfig &config)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            std::cerr << "[config] could not open " << filepath << "\n";
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return loadFromString(buffer.str(), config, filepath);
    }

    std::string ConfigLoader::findConfigFile(const std::string &cmdLinePath)
    {
        if (!cmdLinePath.empty())
        {
            if (std::ifstream test(cmdLinePath); test.good())
                return cmdLinePath;
            std::cerr << "[config] command line config not found: " << cmdLinePath << "\n";
        }

        const std::string defaultPath = "data/config/arbor.json";
        if (std::ifstream test(defaultPath); test.good())
            return defaultPath;

        return {};
    }
} // namespace arbor
