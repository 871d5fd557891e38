#include "arbor/Session.hpp"

#include <chrono>

namespace arbor
{
    namespace
    {
        constexpr uint32_t kSeedMask = 0xfffffu;

        // FNV-1a over the bytes, then a splitmix64 finalizer so short words spread
        // across the low bits kept by kSeedMask.
        uint64_t hashText(const std::string &text)
        {
            uint64_t h = 14695981039346656037ULL;
            for (const unsigned char c : text)
                h = (h ^ c) * 1099511628211ULL;

            h = (h ^ (h >> 30)) * 0xbf58476d1ce4e5b9ULL;
            h = (h ^ (h >> 27)) * 0x94d049bb133111ebULL;
            return h ^ (h >> 31);
        }

        RunConfig drawConfig(Rng &rng, const std::string &configPath, bool &loaded)
        {
            RunConfig config = randomRunConfig(rng);
            loaded           = !configPath.empty() && ConfigLoader::loadFromFile(configPath, config);
            return config;
        }
    } // namespace

    Session::Session(const uint32_t seed, const Canvas &canvas, const std::string &configPath): m_seed(seed),
        m_canvas(canvas),
        m_rng(seed),
        m_configLoaded(false),
        m_config(drawConfig(m_rng, configPath, m_configLoaded)),
        m_detector(canvas.visibility()),
        m_model(m_config.growth, m_rng, m_detector, m_canvas)
    {
        m_model.generate();
    }

    bool Session::update()
    {
        if (!m_paused && m_model.isActive())
            m_model.grow();
        return finished();
    }

    uint32_t Session::seedFromClock()
    {
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch());
        return static_cast<uint32_t>(now.count()) & kSeedMask;
    }

    uint32_t Session::seedFromText(const std::string &text)
    {
        return static_cast<uint32_t>(hashText(text)) & kSeedMask;
    }
} // namespace arbor
