#include "common/Config.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace ladder {

namespace {
using engine::ConfigError;

// Names accepted by spdlog::level::from_str
bool isKnownLogLevel(const std::string& name) {
    static const char* const names[] = {
        "trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off"
    };
    for (const char* known : names) {
        if (name == known) {
            return true;
        }
    }
    return false;
}

std::vector<double> readDoubleList(const nlohmann::json& section, const char* key) {
    if (!section.contains(key)) {
        return {};
    }
    if (!section[key].is_array()) {
        throw ConfigError(std::string("ladder.") + key + " must be an array");
    }
    return section[key].get<std::vector<double>>();
}

std::vector<engine::Level> parseLevels(const nlohmann::json& s) {
    if (s.contains("levels")) {
        const auto& rows = s["levels"];
        if (!rows.is_array()) {
            throw ConfigError("ladder.levels must be an array");
        }
        std::vector<engine::Level> levels;
        int index = 0;
        for (const auto& row : rows) {
            engine::Level level;
            level.index = row.value("index", index);
            level.buy_pct = row.at("buy_pct").get<double>();
            level.sell_pct = row.at("sell_pct").get<double>();
            level.allocation = row.at("allocation").get<double>();
            if (row.contains("next_buy_pct") && !row["next_buy_pct"].is_null()) {
                level.next_buy_pct = row["next_buy_pct"].get<double>();
            }
            levels.push_back(level);
            ++index;
        }
        return levels;
    }

    if (s.contains("buy_pcts") || s.contains("sell_pcts") || s.contains("allocations")) {
        return engine::makeLevels(readDoubleList(s, "buy_pcts"),
                                  readDoubleList(s, "sell_pcts"),
                                  readDoubleList(s, "allocations"),
                                  readDoubleList(s, "next_buy_pcts"));
    }

    return engine::defaultLadderConfig().levels;
}

engine::LadderConfig parseLadder(const nlohmann::json& s) {
    engine::LadderConfig config;
    config.levels = parseLevels(s);
    if (s.contains("starting_capital") && !s["starting_capital"].is_null()) {
        config.starting_capital = s["starting_capital"].get<double>();
    }
    config.seeding = engine::seedingPolicyFromString(s.value("seeding", std::string("independent")));
    config.trigger_mode = engine::triggerModeFromString(s.value("trigger_mode", std::string("high_low")));
    config.reanchor_source = engine::reanchorSourceFromString(s.value("reanchor_source", std::string("watermark")));
    config.reanchor_threshold_pct = s.value("reanchor_threshold_pct", 0.025);

    engine::validateLadderConfig(config);
    return config;
}
}

Config::Config()
    : ladder_config_(engine::defaultLadderConfig())
{}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found: " << config_path << std::endl;
        std::cout << "Using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "Config loaded: levels=" << ladder_config_.levels.size()
              << ", initial_cash=" << ladder_config_.initialCash() << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        std::string log_level = "info";
        std::string log_dir = "logs";
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level = l.value("level", log_level);
            log_dir = l.value("log_dir", log_dir);
        }

        if (!isKnownLogLevel(log_level)) {
            throw ConfigError("unknown logging.level: " + log_level);
        }

        bool normalize_data = false;
        std::string start_date;
        std::string end_date;
        if (j.contains("data")) {
            const auto& d = j["data"];
            normalize_data = d.value("normalize", false);
            start_date = d.value("start_date", std::string());
            end_date = d.value("end_date", std::string());
        }

        std::string output_dir = "output";
        if (j.contains("output")) {
            output_dir = j["output"].value("dir", output_dir);
        }

        engine::LadderConfig ladder_config = j.contains("ladder")
            ? parseLadder(j["ladder"])
            : engine::defaultLadderConfig();

        analytics::PerformanceSettings perf;
        if (j.contains("performance")) {
            const auto& p = j["performance"];
            perf.risk_free_rate = p.value("risk_free_rate", 0.0);
            perf.periods_per_year = p.value("periods_per_year", 365);
        }
        if (perf.periods_per_year <= 0) {
            throw ConfigError("performance.periods_per_year must be positive");
        }

        log_level_ = log_level;
        log_dir_ = log_dir;
        normalize_data_ = normalize_data;
        start_date_ = start_date;
        end_date_ = end_date;
        output_dir_ = output_dir;
        ladder_config_ = ladder_config;
        performance_settings_ = perf;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
}

} // namespace ladder
