#include <gtest/gtest.h>
#include "arbor/Growth.hpp"
#include "arbor/Random.hpp"
#include <cmath>
#include <map>
#include <memory>
#include <utility>
#include <vector>

using namespace arbor;

namespace {

// Owns everything a model borrows.
struct Harness {
    GrowthConfig config;
    Canvas canvas;
    Rng rng;
    CollisionDetector detector;
    GrowthModel model;

    Harness(uint32_t seed, GrowthConfig cfg, Canvas cnv, VisibilityFn visible = {})
        : config(cfg),
          canvas(cnv),
          rng(seed),
          detector(visible ? std::move(visible) : cnv.visibility()),
          model(config, rng, detector, canvas) {}
};

GrowthConfig makeConfig(int seeds, double pBifurcation, double expiryThreshold) {
    GrowthConfig config;
    config.seedCount = seeds;
    config.pBifurcation = pBifurcation;
    config.expiryThreshold = expiryThreshold;
    return config;
}

} // namespace

class GrowthModelTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(GrowthModelTest, Generate_OneRootPerSeed) {
    Harness h(42, makeConfig(6, 0.03, 0.0005), Canvas{400.0, 300.0});
    h.model.generate();

    ASSERT_EQ(h.model.seeds().size(), 6u);
    EXPECT_EQ(h.model.activeLineCount(), 6);
    EXPECT_EQ(h.model.lineCount(), 6u);
    EXPECT_TRUE(h.model.isActive());

    for (size_t i = 0; i < h.model.seeds().size(); i++) {
        const Seed& seed = h.model.seeds()[i];
        ASSERT_EQ(seed.lines.size(), 1u);
        const Line& root = seed.lines[0];
        EXPECT_TRUE(root.isRoot());
        EXPECT_EQ(root.generation, 0);
        EXPECT_EQ(root.angle, seed.angle);
        EXPECT_EQ(root.id.seed, static_cast<int>(i));
        EXPECT_EQ(root.steps, 1u);
        EXPECT_GE(seed.angle, 0.0);
        EXPECT_LT(seed.angle, kPi * 2.0);
        EXPECT_GE(root.origin.x, 0.0);
        EXPECT_LT(root.origin.x, 400.0);
        EXPECT_GE(root.origin.y, 0.0);
        EXPECT_LT(root.origin.y, 300.0);
    }
}

TEST_F(GrowthModelTest, Generate_ZeroSeedsIsInactive) {
    Harness h(42, makeConfig(0, 0.03, 0.0005), Canvas{});
    h.model.generate();
    EXPECT_FALSE(h.model.isActive());
    EXPECT_EQ(h.model.lineCount(), 0u);

    h.model.grow();
    EXPECT_FALSE(h.model.isActive());
}

TEST_F(GrowthModelTest, Generate_NegativeSeedsIsInactive) {
    Harness h(42, makeConfig(-3, 0.03, 0.0005), Canvas{});
    h.model.generate();
    EXPECT_FALSE(h.model.isActive());
    EXPECT_TRUE(h.model.seeds().empty());
}

TEST_F(GrowthModelTest, Generate_AgainResetsForest) {
    Harness h(42, makeConfig(3, 0.05, 0.0005), Canvas{});
    h.model.generate();
    for (int i = 0; i < 50; i++) {
        h.model.grow();
    }
    h.model.generate();
    EXPECT_EQ(h.model.lineCount(), 3u);
    EXPECT_EQ(h.model.activeLineCount(), 3);
    EXPECT_EQ(h.model.ticks(), 0u);
}

TEST_F(GrowthModelTest, Determinism_SameSeedSameForest) {
    GrowthConfig config = makeConfig(4, 0.04, 0.0008);
    Harness a(2024, config, Canvas{300.0, 300.0});
    Harness b(2024, config, Canvas{300.0, 300.0});
    a.model.generate();
    b.model.generate();

    for (int i = 0; i < 150; i++) {
        a.model.grow();
        b.model.grow();
    }

    ASSERT_EQ(a.model.lineCount(), b.model.lineCount());
    EXPECT_EQ(a.model.activeLineCount(), b.model.activeLineCount());
    for (size_t s = 0; s < a.model.seeds().size(); s++) {
        const auto& la = a.model.seeds()[s].lines;
        const auto& lb = b.model.seeds()[s].lines;
        ASSERT_EQ(la.size(), lb.size());
        for (size_t i = 0; i < la.size(); i++) {
            EXPECT_EQ(la[i].origin, lb[i].origin);
            EXPECT_EQ(la[i].tip, lb[i].tip);
            EXPECT_EQ(la[i].steps, lb[i].steps);
            EXPECT_EQ(la[i].active, lb[i].active);
            EXPECT_EQ(la[i].tag, lb[i].tag);
        }
    }
    EXPECT_EQ(a.rng.next(), b.rng.next());
}

TEST_F(GrowthModelTest, StepCount_OnePerTick) {
    Harness h(7, makeConfig(3, 0.04, 0.0005), Canvas{300.0, 300.0});
    h.model.generate();

    for (int tick = 0; tick < 200 && h.model.isActive(); tick++) {
        std::map<std::pair<int, int>, uint32_t> before;
        h.model.forEachLineUntilTrue([&](const Line& line) {
            if (line.active) {
                before[{line.id.seed, line.id.line}] = line.steps;
            }
            return false;
        });

        h.model.grow();

        for (const auto& entry : before) {
            const Line& line = h.model.line(LineId{entry.first.first, entry.first.second});
            EXPECT_EQ(line.steps, entry.second + 1);
        }
    }
}

// A root that keeps growing has taken one step per tick plus its creation step
TEST_F(GrowthModelTest, StepCount_RootTracksTicks) {
    Harness h(3, makeConfig(1, 0.0, 0.0), Canvas{}, [](double, double) { return true; });
    h.model.generate();
    for (int i = 0; i < 25; i++) {
        h.model.grow();
    }
    const Line& root = h.model.line(LineId{0, 0});
    EXPECT_TRUE(root.active);
    EXPECT_EQ(root.steps, 26u);
    EXPECT_EQ(h.model.ticks(), 25u);
}

TEST_F(GrowthModelTest, Split_ChildAppendedPerpendicular) {
    Harness h(1, makeConfig(1, 1.0, 0.0), Canvas{}, [](double, double) { return true; });
    h.model.generate();
    h.model.grow();

    const auto& lines = h.model.seeds()[0].lines;
    ASSERT_EQ(lines.size(), 2u);
    const Line& root = lines[0];
    const Line& child = lines[1];

    EXPECT_EQ(child.parent, root.id);
    EXPECT_EQ(child.generation, 1);
    EXPECT_EQ(child.id, (LineId{0, 1}));
    EXPECT_EQ(child.steps, 1u);
    EXPECT_NEAR(std::abs(child.angle - root.angle), kPi / 2.0, 1e-12);
    EXPECT_EQ(child.origin, root.tip);
    EXPECT_FALSE(root.pendingSplit);
    EXPECT_EQ(h.model.activeLineCount(), 2);
}

// Children spawned during a tick are not advanced until the next one
TEST_F(GrowthModelTest, Split_ChildWaitsForNextTick) {
    Harness h(1, makeConfig(1, 1.0, 0.0), Canvas{}, [](double, double) { return true; });
    h.model.generate();
    h.model.grow();
    EXPECT_EQ(h.model.line(LineId{0, 1}).steps, 1u);

    h.model.grow();
    EXPECT_EQ(h.model.line(LineId{0, 1}).steps, 2u);
    EXPECT_EQ(h.model.line(LineId{0, 0}).steps, 3u);
}

// Seed 1: the child overlaps its parent at the branch point but is never stopped by it
TEST_F(GrowthModelTest, ParentChild_NoCollisionAfterGrow) {
    Harness h(1, makeConfig(1, 1.0, 0.0), Canvas{}, [](double, double) { return true; });
    h.model.generate();
    h.model.grow();
    ASSERT_EQ(h.model.lineCount(), 2u);

    h.model.grow();
    EXPECT_TRUE(h.model.line(LineId{0, 0}).active);
    EXPECT_TRUE(h.model.line(LineId{0, 1}).active);
}

TEST_F(GrowthModelTest, Boundary_RootStopsAndRetracts) {
    Harness h(9, makeConfig(1, 0.0, 0.0), Canvas{60.0, 60.0});
    h.model.generate();

    int guard = 0;
    while (h.model.isActive() && guard++ < 1000) {
        h.model.grow();
    }
    ASSERT_FALSE(h.model.isActive());

    const Line& root = h.model.line(LineId{0, 0});
    EXPECT_FALSE(root.active);
    EXPECT_FALSE(root.expired);
    EXPECT_TRUE(h.canvas.isVisible(root.tip.x, root.tip.y));
    EXPECT_LE(guard, 100);
}

// Roots only, nothing expires and the canvas never clips, so the first stop
// has to come from one root running into another.
TEST_F(GrowthModelTest, Collision_RootStopsOnAnotherLine) {
    Harness h(11, makeConfig(10, 0.0, 0.0), Canvas{50.0, 50.0}, [](double, double) { return true; });
    h.model.generate();
    ASSERT_EQ(h.model.activeLineCount(), 10);

    int guard = 0;
    while (h.model.activeLineCount() == 10 && guard++ < 1000) {
        h.model.grow();
    }
    ASSERT_LT(h.model.activeLineCount(), 10);
    EXPECT_EQ(h.model.lineCount(), 10u);

    int active = 0;
    int stopped = 0;
    h.model.forEachLineUntilTrue([&](const Line& line) {
        if (line.active) {
            active++;
            return false;
        }
        stopped++;
        EXPECT_FALSE(line.expired);
        EXPECT_NEAR(len(line.tip - line.origin), static_cast<double>(line.steps - 1), 1e-9);

        // Re-applying the retracted step must cross some other root.
        const Vec2 reached = line.tip + heading(line.angle);
        bool hit = false;
        h.model.forEachLineUntilTrue([&](const Line& other) {
            if (other.id == line.id || areAdjacent(line, other)) {
                return false;
            }
            hit = segmentsIntersect(line.origin, reached, other.origin, other.tip);
            return hit;
        });
        EXPECT_TRUE(hit) << "line " << line.id.seed << " stopped without a crossing";
        return false;
    });
    EXPECT_GT(stopped, 0);
    EXPECT_EQ(active, h.model.activeLineCount());
    EXPECT_EQ(active + stopped, 10);
}

TEST_F(GrowthModelTest, Expiry_DeactivatesWithoutRetract) {
    Harness h(5, makeConfig(1, 1.0, 1.0), Canvas{}, [](double, double) { return true; });
    h.model.generate();
    h.model.grow();
    ASSERT_EQ(h.model.lineCount(), 2u);
    const Line child = h.model.line(LineId{0, 1});
    EXPECT_TRUE(child.expired);
    EXPECT_TRUE(child.active);

    h.model.grow();
    const Line& after = h.model.line(LineId{0, 1});
    EXPECT_FALSE(after.active);
    EXPECT_EQ(after.steps, child.steps + 1);
    EXPECT_NEAR(len(after.tip - after.origin), static_cast<double>(after.steps), 1e-9);
}

TEST_F(GrowthModelTest, ActiveCounter_MatchesForest) {
    Harness h(77, makeConfig(5, 0.04, 0.0005), Canvas{250.0, 250.0});
    h.model.generate();
    for (int i = 0; i < 120; i++) {
        h.model.grow();
        int active = 0;
        h.model.forEachLineUntilTrue([&](const Line& line) {
            if (line.active) {
                active++;
            }
            return false;
        });
        EXPECT_EQ(active, h.model.activeLineCount());
    }
}

TEST_F(GrowthModelTest, Traversal_OrderAndEarlyStop) {
    Harness h(8, makeConfig(3, 0.05, 0.0), Canvas{300.0, 300.0});
    h.model.generate();
    for (int i = 0; i < 40; i++) {
        h.model.grow();
    }

    std::vector<LineId> order;
    bool stopped = h.model.forEachLineUntilTrue([&](const Line& line) {
        order.push_back(line.id);
        return false;
    });
    EXPECT_FALSE(stopped);
    ASSERT_EQ(order.size(), h.model.lineCount());
    for (size_t i = 1; i < order.size(); i++) {
        bool sameSeedNext = order[i].seed == order[i - 1].seed && order[i].line == order[i - 1].line + 1;
        bool nextSeed = order[i].seed == order[i - 1].seed + 1 && order[i].line == 0;
        EXPECT_TRUE(sameSeedNext || nextSeed);
    }

    int visited = 0;
    stopped = h.model.forEachLineUntilTrue([&](const Line&) {
        return ++visited == 2;
    });
    EXPECT_TRUE(stopped);
    EXPECT_EQ(visited, 2);
}

// Once stopped, a line stays stopped
TEST_F(GrowthModelTest, Inactive_NeverReactivates) {
    Harness h(31, makeConfig(4, 0.04, 0.001), Canvas{200.0, 200.0});
    h.model.generate();
    std::map<std::pair<int, int>, Vec2> stopped;

    for (int i = 0; i < 400 && h.model.isActive(); i++) {
        h.model.grow();
        h.model.forEachLineUntilTrue([&](const Line& line) {
            auto key = std::make_pair(line.id.seed, line.id.line);
            auto it = stopped.find(key);
            if (it != stopped.end()) {
                EXPECT_FALSE(line.active);
                EXPECT_EQ(line.tip, it->second);
            } else if (!line.active) {
                stopped[key] = line.tip;
            }
            return false;
        });
    }
}

TEST_F(GrowthModelTest, Termination_RepresentativeSeeds) {
    const uint32_t seeds[] = {1, 2, 3, 7, 42, 99, 1234};
    for (uint32_t seed : seeds) {
        Harness h(seed, makeConfig(5, 0.03, 0.0005), Canvas{200.0, 200.0});
        h.model.generate();
        int ticks = 0;
        while (h.model.isActive() && ticks < 20000) {
            h.model.grow();
            ticks++;
        }
        EXPECT_FALSE(h.model.isActive()) << "seed " << seed;
        EXPECT_EQ(h.model.activeLineCount(), 0) << "seed " << seed;
    }
}
