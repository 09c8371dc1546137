#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/LadderTypes.h"

namespace ladder {
namespace backtest {

struct JournalEntry {
    std::uint64_t seq = 0;
    engine::TradeRecord trade;
};

// Append-only trade log, one JSON object per line
class TradeJournalJsonl {
public:
    explicit TradeJournalJsonl(std::filesystem::path file_path);

    bool append(const engine::TradeRecord& trade);
    // Truncates the file and writes every record in order
    bool rewriteAll(const std::vector<engine::TradeRecord>& trades);
    std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const { return last_seq_; }
    const std::filesystem::path& path() const { return file_path_; }

    static nlohmann::json toJson(const engine::TradeRecord& trade);
    static engine::TradeRecord fromJson(const nlohmann::json& line);

private:
    std::filesystem::path file_path_;
    std::uint64_t last_seq_ = 0;
};

} // namespace backtest
} // namespace ladder
