#include "engine/LadderConfig.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace ladder {
namespace engine {

namespace {
std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

bool isFraction(double v) {
    return std::isfinite(v) && v > 0.0 && v < 1.0;
}

std::string levelTag(const Level& level) {
    return "level " + std::to_string(level.index);
}
}

double LadderConfig::totalAllocation() const {
    double total = 0.0;
    for (const auto& level : levels) {
        total += level.allocation;
    }
    return total;
}

double LadderConfig::initialCash() const {
    return starting_capital ? *starting_capital : totalAllocation();
}

std::vector<Level> makeLevels(const std::vector<double>& buy_pcts,
                              const std::vector<double>& sell_pcts,
                              const std::vector<double>& allocations,
                              const std::vector<double>& next_buy_pcts) {
    if (buy_pcts.size() != sell_pcts.size() || buy_pcts.size() != allocations.size()) {
        throw ConfigError("level lists differ in length: buy_pcts=" + std::to_string(buy_pcts.size()) +
                          ", sell_pcts=" + std::to_string(sell_pcts.size()) +
                          ", allocations=" + std::to_string(allocations.size()));
    }
    if (!next_buy_pcts.empty() && next_buy_pcts.size() != buy_pcts.size()) {
        throw ConfigError("next_buy_pcts has " + std::to_string(next_buy_pcts.size()) +
                          " entries, expected " + std::to_string(buy_pcts.size()));
    }

    std::vector<Level> levels;
    levels.reserve(buy_pcts.size());
    for (size_t i = 0; i < buy_pcts.size(); ++i) {
        Level level;
        level.index = static_cast<int>(i);
        level.buy_pct = buy_pcts[i];
        level.sell_pct = sell_pcts[i];
        level.allocation = allocations[i];
        if (!next_buy_pcts.empty()) {
            level.next_buy_pct = next_buy_pcts[i];
        }
        levels.push_back(level);
    }
    return levels;
}

void validateLadderConfig(const LadderConfig& config) {
    if (config.levels.empty()) {
        throw ConfigError("ladder has no levels");
    }

    for (size_t i = 0; i < config.levels.size(); ++i) {
        const Level& level = config.levels[i];
        if (level.index != static_cast<int>(i)) {
            throw ConfigError("level indices must be 0.." + std::to_string(config.levels.size() - 1) +
                              " in order, found " + std::to_string(level.index) +
                              " at position " + std::to_string(i));
        }
        if (!isFraction(level.buy_pct)) {
            throw ConfigError(levelTag(level) + ": buy_pct must be in (0, 1)");
        }
        if (!std::isfinite(level.sell_pct) || level.sell_pct <= 0.0) {
            throw ConfigError(levelTag(level) + ": sell_pct must be positive");
        }
        if (!std::isfinite(level.allocation) || level.allocation <= 0.0) {
            throw ConfigError(levelTag(level) + ": allocation must be positive");
        }
        if (level.next_buy_pct && !isFraction(*level.next_buy_pct)) {
            throw ConfigError(levelTag(level) + ": next_buy_pct must be in (0, 1)");
        }
    }

    if (!std::isfinite(config.reanchor_threshold_pct) || config.reanchor_threshold_pct <= 0.0) {
        throw ConfigError("reanchor_threshold_pct must be positive");
    }
    if (config.starting_capital &&
        (!std::isfinite(*config.starting_capital) || *config.starting_capital < 0.0)) {
        throw ConfigError("starting_capital must be non-negative");
    }
}

LadderConfig defaultLadderConfig() {
    LadderConfig config;
    config.levels = makeLevels(
        {0.04, 0.06, 0.08, 0.10, 0.12},
        {0.03, 0.04, 0.05, 0.06, 0.07},
        {100.0, 150.0, 200.0, 300.0, 400.0}
    );
    return config;
}

std::string toString(SeedingPolicy policy) {
    switch (policy) {
        case SeedingPolicy::INDEPENDENT: return "independent";
        case SeedingPolicy::CASCADE: return "cascade";
    }
    return "independent";
}

std::string toString(TriggerMode mode) {
    switch (mode) {
        case TriggerMode::CLOSE_ONLY: return "close_only";
        case TriggerMode::HIGH_LOW: return "high_low";
    }
    return "high_low";
}

std::string toString(ReanchorSource source) {
    switch (source) {
        case ReanchorSource::WATERMARK: return "watermark";
        case ReanchorSource::BAR_CLOSE: return "bar_close";
    }
    return "watermark";
}

SeedingPolicy seedingPolicyFromString(const std::string& value) {
    const std::string name = normalizeName(value);
    if (name == "independent") return SeedingPolicy::INDEPENDENT;
    if (name == "cascade" || name == "cascading") return SeedingPolicy::CASCADE;
    throw ConfigError("unknown seeding policy: " + value);
}

TriggerMode triggerModeFromString(const std::string& value) {
    const std::string name = normalizeName(value);
    if (name == "close_only" || name == "close") return TriggerMode::CLOSE_ONLY;
    if (name == "high_low" || name == "intrabar") return TriggerMode::HIGH_LOW;
    throw ConfigError("unknown trigger mode: " + value);
}

ReanchorSource reanchorSourceFromString(const std::string& value) {
    const std::string name = normalizeName(value);
    if (name == "watermark") return ReanchorSource::WATERMARK;
    if (name == "bar_close" || name == "close") return ReanchorSource::BAR_CLOSE;
    throw ConfigError("unknown reanchor source: " + value);
}

} // namespace engine
} // namespace ladder
