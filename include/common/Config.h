#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/LadderConfig.h"
#include "analytics/PerformanceAnalyzer.h"

namespace ladder {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults; malformed content throws engine::ConfigError
    void load(const std::string& config_path);
    // Replaces every setting; on error the previous settings stay in place
    void loadFromJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    bool shouldNormalizeData() const { return normalize_data_; }
    std::string getStartDate() const { return start_date_; }
    std::string getEndDate() const { return end_date_; }
    std::string getOutputDir() const { return output_dir_; }
    double getInitialCapital() const { return ladder_config_.initialCash(); }

    engine::LadderConfig getLadderConfig() const { return ladder_config_; }
    analytics::PerformanceSettings getPerformanceSettings() const { return performance_settings_; }

private:
    Config();

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    bool normalize_data_ = false;
    std::string start_date_;
    std::string end_date_;
    std::string output_dir_ = "output";

    engine::LadderConfig ladder_config_;
    analytics::PerformanceSettings performance_settings_;
};

} // namespace ladder
