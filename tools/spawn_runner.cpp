// spawn_runner: headless content streaming check
//
// Drives the spawn scheduler with a constant-speed agent and reports what the
// window did: sections spawned/recycled, cursor, difficulty, pool usage.
// Useful for validating new section libraries and variant sets.
//
// Usage:
//   spawn_runner [options]
//     --seed <hex|dec>      Spawn seed (default: 0xC0FFEE)
//     --ticks <n>           Ticks to run (default: 36000 = 5 min at 120Hz)
//     --speed <units/s>     Agent forward speed (default: 18)
//     --sections <name>     Section library under assets/sections (default: sections)
//     --config <path>       Spawner config under assets/ (default: config/spawner.json)
//     --variants <path>     Variant set under assets/ (default: variants/city.json)
//     --goal <distance>     Goal distance; 0 = endless (default: 0)
//     --json                Output as JSON instead of plain text
//     --quiet               Only output final summary line
//     -h, --help            Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "sim/ContentCatalog.hpp"
#include "sim/InstancePool.hpp"
#include "sim/ObstacleType.hpp"
#include "sim/SafeZonePolicy.hpp"
#include "sim/SpawnScheduler.hpp"
#include "sim/VariantSet.hpp"

namespace {

constexpr float kTickDt = 1.0f / 120.0f;

struct RunnerArgs {
    uint32_t seed = cfg::kDefaultSeed;
    int maxTicks = 36000;           // 5 minutes at 120 Hz
    float speed = 18.0f;
    std::string sections = "sections";
    std::string configPath = "config/spawner.json";
    std::string variantsPath = "variants/city.json";
    float goal = 0.0f;
    bool json = false;
    bool quiet = false;
    bool help = false;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--ticks") == 0) && i + 1 < argc) {
            args.maxTicks = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--speed") == 0) && i + 1 < argc) {
            args.speed = static_cast<float>(std::atof(argv[++i]));
        } else if ((std::strcmp(argv[i], "--sections") == 0) && i + 1 < argc) {
            args.sections = argv[++i];
        } else if ((std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            args.configPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--variants") == 0) && i + 1 < argc) {
            args.variantsPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--goal") == 0) && i + 1 < argc) {
            args.goal = static_cast<float>(std::atof(argv[++i]));
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "spawn_runner: headless StreetDash content streaming check\n"
        "\n"
        "Usage: spawn_runner [options]\n"
        "  --seed <hex|dec>      Spawn seed (default: 0xC0FFEE)\n"
        "  --ticks <n>           Ticks to run (default: 36000 = 5 min)\n"
        "  --speed <units/s>     Agent forward speed (default: 18)\n"
        "  --sections <name>     Section library name (default: sections)\n"
        "  --config <path>       Spawner config (default: config/spawner.json)\n"
        "  --variants <path>     Variant set (default: variants/city.json)\n"
        "  --goal <distance>     Goal distance, 0 = endless (default: 0)\n"
        "  --json                Output as JSON\n"
        "  --quiet               Only output final summary line\n"
        "  -h, --help            Print this help\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }

    Log::Init((args.quiet || args.json) ? spdlog::level::warn : spdlog::level::info);
    if (!CrashHandler::Install()) {
        LOG_DEBUG("Running without crash traces");
    }

    SpawnConfig config{};
    if (!LoadSpawnConfigFromFile(config, args.configPath.c_str())) {
        LOG_WARN("Running with built-in spawner defaults");
    }
    config.seed = args.seed;

    ContentCatalog catalog;
    if (!catalog.Load(args.sections)) {
        LOG_CRITICAL("Cannot start: section library '{}' failed to load", args.sections);
        Log::Shutdown();
        return 2;
    }

    VariantSet variants;
    if (!LoadVariantSetFromFile(variants, args.variantsPath.c_str())) {
        LOG_WARN("No variant set loaded, generic obstacles only");
    }

    const std::optional<float> goal =
        (args.goal > 0.0f) ? std::optional<float>(args.goal) : std::nullopt;

    VariantClassificationTable classification;
    if (!classification.LoadFromFile("config/obstacle_types.json")) {
        LOG_INFO("Using built-in obstacle classification");
    }
    InstancePoolRegistry pools;
    SafeZonePolicy policy(config, goal);
    SpawnScheduler scheduler(catalog, classification, pools, policy, config);
    scheduler.SetVariantSet(variants);

    int safeZoneEntries = 0;
    SpawnEvents events;
    events.onEnteredSafeZone = [&](float, SafeReason) { ++safeZoneEntries; };
    scheduler.SetEvents(events);

    if (!scheduler.Initialize()) {
        LOG_CRITICAL("Cannot start: spawner initialization failed");
        Log::Shutdown();
        return 2;
    }

    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    float agentZ = 0.0f;
    int ticksRun = 0;
    size_t maxWindow = scheduler.GetActiveSegments().size();
    bool reachedGoal = false;

    for (int t = 0; t < args.maxTicks; ++t) {
        agentZ += args.speed * kTickDt;
        scheduler.Update(agentZ);
        ++ticksRun;
        if (scheduler.GetActiveSegments().size() > maxWindow) {
            maxWindow = scheduler.GetActiveSegments().size();
        }

        if (goal.has_value() && agentZ >= *goal) {
            reachedGoal = true;
            scheduler.ClearContentNearGoal();
            scheduler.Stop();
            break;
        }
    }

    const auto wallEnd = Clock::now();
    const float wallMs = std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();
    const float perfMsPer1k = (ticksRun > 0) ? (wallMs / (static_cast<float>(ticksRun) / 1000.0f)) : 0.0f;

    const SpawnStats& stats = scheduler.GetStats();
    const std::string poolStats = scheduler.GetPoolStats();

    if (args.json) {
        std::printf("{\n");
        std::printf("  \"seed\": \"0x%08X\",\n", args.seed);
        std::printf("  \"ticks_run\": %d,\n", ticksRun);
        std::printf("  \"distance\": %.1f,\n", agentZ);
        std::printf("  \"cursor\": %.1f,\n", scheduler.GetSpawnCursor());
        std::printf("  \"segments_spawned\": %d,\n", stats.segmentsSpawned);
        std::printf("  \"segments_recycled\": %d,\n", stats.segmentsRecycled);
        std::printf("  \"window\": %zu,\n", scheduler.GetActiveSegments().size());
        std::printf("  \"max_window\": %zu,\n", maxWindow);
        std::printf("  \"difficulty\": %d,\n", scheduler.GetCurrentDifficulty());
        std::printf("  \"obstacles\": %d,\n", stats.obstaclesPlaced);
        std::printf("  \"coins\": %d,\n", stats.coinsPlaced);
        std::printf("  \"support_items\": %d,\n", stats.supportItemsPlaced);
        std::printf("  \"skipped\": %d,\n", stats.placementsSkipped);
        std::printf("  \"safe_zone_entries\": %d,\n", safeZoneEntries);
        std::printf("  \"reached_goal\": %s,\n", reachedGoal ? "true" : "false");
        std::printf("  \"pools\": \"%s\",\n", poolStats.c_str());
        std::printf("  \"wall_ms\": %.2f,\n", wallMs);
        std::printf("  \"perf_ms_per_1k\": %.3f\n", perfMsPer1k);
        std::printf("}\n");
    } else if (args.quiet) {
        std::printf("seed=0x%08X  spawned=%-5d recycled=%-5d cursor=%-9.1f diff=%d  window=%zu  %s  perf=%.3fms/1k\n",
                    args.seed, stats.segmentsSpawned, stats.segmentsRecycled,
                    scheduler.GetSpawnCursor(), scheduler.GetCurrentDifficulty(),
                    maxWindow, poolStats.c_str(), perfMsPer1k);
    } else {
        std::printf("=== StreetDash Spawn Runner ===\n");
        std::printf("seed:        0x%08X\n", args.seed);
        std::printf("library:     %s (version %s, %d sections)\n", args.sections.c_str(),
                    catalog.GetVersion().c_str(), catalog.GetSegmentCount());
        std::printf("ticks:       %d / %d\n", ticksRun, args.maxTicks);
        std::printf("distance:    %.1f units\n", agentZ);
        std::printf("cursor:      %.1f units\n", scheduler.GetSpawnCursor());
        std::printf("sections:    %d spawned, %d recycled\n", stats.segmentsSpawned, stats.segmentsRecycled);
        std::printf("window:      %zu active (max %zu)\n", scheduler.GetActiveSegments().size(), maxWindow);
        std::printf("difficulty:  %d / %d\n", scheduler.GetCurrentDifficulty(), config.maxDifficulty);
        std::printf("placed:      %d obstacles, %d coins, %d support items\n",
                    stats.obstaclesPlaced, stats.coinsPlaced, stats.supportItemsPlaced);
        std::printf("skipped:     %d placements\n", stats.placementsSkipped);
        std::printf("safe zones:  %d entered\n", safeZoneEntries);
        if (goal.has_value()) {
            std::printf("goal:        %.1f (%s)\n", *goal, reachedGoal ? "reached" : "not reached");
        }
        std::printf("pools:       %s\n", poolStats.c_str());
        std::printf("wall_time:   %.2f ms\n", wallMs);
        std::printf("perf:        %.3f ms / 1000 ticks\n", perfMsPer1k);
    }

    Log::Shutdown();
    return 0;
}
