#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"

#include <filesystem>
#include <iostream>
#include <string>

using namespace ladder;

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <prices.csv|prices.json> [--config <config.json>] [--output <dir>]\n"
              << "  CSV rows: timestamp,open,high,low,close[,volume] or timestamp,close\n";
}

// Prefer a path relative to the working directory when it exists there
static std::string resolveUserPath(const std::string& path) {
    const std::filesystem::path p(path);
    if (p.is_relative() && std::filesystem::exists(p)) {
        return std::filesystem::absolute(p).string();
    }
    return path;
}

int main(int argc, char* argv[]) {
    std::string data_path;
    std::string config_path = "config/config.json";
    std::string output_dir;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (data_path.empty()) {
            data_path = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (data_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        Config& config = Config::getInstance();
        config.load(resolveUserPath(config_path));

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
        if (output_dir.empty()) {
            output_dir = config.getOutputDir();
        }

        backtest::BacktestEngine engine;
        engine.init(config);
        engine.loadData(resolveUserPath(data_path));
        engine.run();
        engine.logSummary();

        const std::filesystem::path out_dir(output_dir);
        const bool curve_written = engine.writeEquityCurveCsv((out_dir / "equity_curve.csv").string());
        const bool journal_written = engine.writeTradeJournal((out_dir / "trades.jsonl").string());
        if (!curve_written || !journal_written) {
            std::cerr << "Failed to write results to " << out_dir.string() << std::endl;
            return 1;
        }

        return engine.getResult().ledger_consistent ? 0 : 1;
    } catch (const engine::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 3;
    } catch (const engine::DataError& e) {
        LOG_ERROR("Input data error: {}", e.what());
        std::cerr << "Input data error: " << e.what() << std::endl;
        return 4;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
