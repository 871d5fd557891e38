#include <cstdint>
#include <iostream>
#include <string>

#include "arbor/Args.hpp"
#include "arbor/Config.hpp"
#include "arbor/Session.hpp"

using namespace arbor;

namespace
{
    void printUsage(const char *prog)
    {
        std::cout << "Usage: " << prog << " [options]\n"
                  << "  --seed N          seed for the run (default: clock)\n"
                  << "  --seed-text WORD  derive the seed from a word\n"
                  << "  --config PATH     JSON overrides for the drawn configuration\n"
                  << "                    (default data/config/arbor.json if present;\n"
                  << "                    data/config/arbor.example.json lists every key)\n"
                  << "  --size W H        canvas size (default 800 600)\n"
                  << "  --max-ticks N     stop after N ticks (default 100000)\n"
                  << "  --help            show this text\n";
    }
} // namespace

int main(int argc, char *argv[])
{
    uint32_t    seed     = Session::seedFromClock();
    std::string configArg;
    Canvas      canvas;
    uint64_t    maxTicks = 100000;

    for (int i = 1; i < argc; i++)
    {
        const std::string arg = argv[i];

        if (arg == "--seed" && i + 1 < argc)
        {
            if (!parseSeed(argv[++i], seed))
            {
                std::cerr << "Invalid seed: " << argv[i] << " (expected 0..4294967295)\n";
                return 1;
            }
        }
        else if (arg == "--seed-text" && i + 1 < argc)
        {
            seed = Session::seedFromText(argv[++i]);
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            configArg = argv[++i];
        }
        else if (arg == "--size" && i + 2 < argc)
        {
            double w = 0.0, h = 0.0;
            if (!parseExtent(argv[i + 1], w) || !parseExtent(argv[i + 2], h))
            {
                std::cerr << "Invalid size: " << argv[i + 1] << " " << argv[i + 2] << "\n";
                return 1;
            }
            canvas = Canvas{w, h};
            i += 2;
        }
        else if (arg == "--max-ticks" && i + 1 < argc)
        {
            if (!parseTickLimit(argv[++i], maxTicks))
            {
                std::cerr << "Invalid tick limit: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    const std::string configPath = ConfigLoader::findConfigFile(configArg);
    Session           session(seed, canvas, configPath);

    const auto &g = session.config().growth;
    std::cout << "Seed " << seed << " on " << canvas.width << "x" << canvas.height << ": seeds=" << g.seedCount
              << " pBifurcation=" << g.pBifurcation << " expiryThreshold=" << g.expiryThreshold << "\n";

    bool finished = session.finished();
    while (!finished && session.model().ticks() < maxTicks)
        finished = session.update();

    const GrowthModel &model = session.model();
    std::cout << (finished ? "Finished" : "Tick limit reached") << " after " << model.ticks() << " ticks: "
              << model.lineCount() << " lines, " << model.activeLineCount() << " still active\n";

    return finished ? 0 : 2;
}
