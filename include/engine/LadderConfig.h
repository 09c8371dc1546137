#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ladder {
namespace engine {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// How the initial quotes are derived from the first bar's close
enum class SeedingPolicy {
    INDEPENDENT,    // every level from P0
    CASCADE         // each level from the previous level's quote
};

// Which bar prices drive triggers
enum class TriggerMode {
    CLOSE_ONLY,     // close for every trigger
    HIGH_LOW        // high for sells/watermark, low for buys
};

// Anchor for the level-0 re-quote after the watermark rises
enum class ReanchorSource {
    WATERMARK,
    BAR_CLOSE
};

struct Level {
    int index = 0;
    double buy_pct = 0.0;                 // pullback below the anchor that triggers a buy
    double sell_pct = 0.0;                // rise above the fill that triggers the sell
    double allocation = 0.0;              // capital committed on fill
    std::optional<double> next_buy_pct;   // pullback used for the next, deeper quote
};

struct LadderConfig {
    std::vector<Level> levels;
    std::optional<double> starting_capital;  // defaults to the sum of allocations
    SeedingPolicy seeding = SeedingPolicy::INDEPENDENT;
    TriggerMode trigger_mode = TriggerMode::HIGH_LOW;
    ReanchorSource reanchor_source = ReanchorSource::WATERMARK;
    double reanchor_threshold_pct = 0.025;

    double totalAllocation() const;
    double initialCash() const;
};

// Builds levels from parallel lists; lengths must match.
std::vector<Level> makeLevels(const std::vector<double>& buy_pcts,
                              const std::vector<double>& sell_pcts,
                              const std::vector<double>& allocations,
                              const std::vector<double>& next_buy_pcts = {});

// Throws ConfigError on the first violation.
void validateLadderConfig(const LadderConfig& config);

// Five tiers, shallow/small to deep/large.
LadderConfig defaultLadderConfig();

std::string toString(SeedingPolicy policy);
std::string toString(TriggerMode mode);
std::string toString(ReanchorSource source);
SeedingPolicy seedingPolicyFromString(const std::string& value);
TriggerMode triggerModeFromString(const std::string& value);
ReanchorSource reanchorSourceFromString(const std::string& value);

} // namespace engine
} // namespace ladder
